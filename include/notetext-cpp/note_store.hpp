/// @file note_store.hpp
/// @brief Read-only access to a NoteStore.sqlite database.

#pragma once

#include <notetext-cpp/error.hpp>
#include <notetext-cpp/note.hpp>
#include <notetext-cpp/types.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct sqlite3;

namespace notetext_cpp {

/// Seconds between the Unix epoch and the store's epoch (2001-01-01 UTC).
inline constexpr std::int64_t apple_epoch_offset = 978307200;

/// Convert a store timestamp (seconds since 2001-01-01) to Unix seconds.
constexpr auto apple_time_to_unix(double apple_seconds) noexcept -> std::int64_t {
    return static_cast<std::int64_t>(apple_seconds) + apple_epoch_offset;
}

/// One row of the note listing.
struct StoredNote {
    std::int64_t id = 0;                   ///< Primary key.
    std::string title;                     ///< "Untitled" when the store has none.
    std::string snippet;                   ///< Plain-text preview, possibly empty.
    std::optional<std::int64_t> created;   ///< Unix seconds.
    std::optional<std::int64_t> modified;  ///< Unix seconds.
    std::optional<std::string> folder;
    std::vector<std::byte> data;           ///< Raw (usually gzip) note record.

    /// View suitable for decode_note()/decode_notes(); borrows this object.
    auto input() const -> NoteInput { return NoteInput{.data = data, .snippet = snippet}; }
};

/// Metadata of an attachment object. Payload loading is left to the host.
struct AttachmentRecord {
    std::string identifier;
    std::string type_uti;
    std::optional<std::string> filename;
    std::optional<std::int64_t> size;

    auto operator==(const AttachmentRecord&) const -> bool = default;
};

/// A NoteStore.sqlite database opened read-only.
///
/// The connection is opened in serialized mode, so lookup() may be used
/// from decode_notes() worker threads.
///
/// @code
/// auto store = NoteStore{NoteStore::default_path()};
/// for (const auto& row : store.notes()) {
///     auto note = decode_note(row.input(), store.lookup());
/// }
/// @endcode
class NoteStore {
public:
    /// @throws StoreError if the database cannot be opened.
    explicit NoteStore(const std::filesystem::path& path);

    /// A moved-from store has no connection; its queries throw StoreError.
    NoteStore(NoteStore&&) noexcept = default;
    auto operator=(NoteStore&&) noexcept -> NoteStore& = default;
    NoteStore(const NoteStore&) = delete;
    auto operator=(const NoteStore&) -> NoteStore& = delete;

    /// ~/Library/Group Containers/group.com.apple.notes/NoteStore.sqlite
    static auto default_path() -> std::filesystem::path;

    /// Notes with a title that are not marked for deletion, newest first.
    /// @throws StoreError on query failure.
    auto notes() const -> std::vector<StoredNote>;

    /// Replacement text of an inline attachment (hashtag, mention).
    /// @throws StoreError on query failure.
    auto inline_text(std::string_view identifier) const -> std::optional<std::string>;

    /// Metadata of the attachment object with this identifier.
    /// @throws StoreError on query failure.
    auto attachment_record(std::string_view identifier) const -> std::optional<AttachmentRecord>;

    /// An AttachmentLookup that resolves inline kinds through inline_text()
    /// and leaves every other kind as a file marker. The lookup shares the
    /// connection, so it stays valid after this store is moved or destroyed.
    auto lookup() const -> AttachmentLookup;

private:
    std::shared_ptr<sqlite3> db_;
};

}  // namespace notetext_cpp
