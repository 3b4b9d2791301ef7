#include <notetext-cpp/note_store.hpp>

#include <sqlite3.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <memory>
#include <utility>

namespace notetext_cpp {

namespace {

constexpr const char* notes_sql = R"sql(
    SELECT
        n.Z_PK,
        n.ZTITLE1,
        n.ZSNIPPET,
        n.ZCREATIONDATE1,
        n.ZMODIFICATIONDATE1,
        f.ZTITLE2,
        c.ZDATA
    FROM ZICCLOUDSYNCINGOBJECT n
    LEFT JOIN ZICCLOUDSYNCINGOBJECT f ON n.ZFOLDER = f.Z_PK
    LEFT JOIN ZICNOTEDATA c ON n.ZNOTEDATA = c.Z_PK
    WHERE n.ZTITLE1 IS NOT NULL
        AND n.ZMARKEDFORDELETION = 0
    ORDER BY n.ZMODIFICATIONDATE1 DESC
)sql";

constexpr const char* inline_text_sql =
    "SELECT ZALTTEXT FROM ZICCLOUDSYNCINGOBJECT "
    "WHERE ZIDENTIFIER = ?1 AND ZALTTEXT IS NOT NULL LIMIT 1";

constexpr const char* attachment_sql =
    "SELECT ZIDENTIFIER, ZTYPEUTI, ZFILENAME, ZFILESIZE FROM ZICCLOUDSYNCINGOBJECT "
    "WHERE ZIDENTIFIER = ?1 LIMIT 1";

struct ConnectionDeleter {
    // close_v2 defers the close until outstanding statements are finalized.
    void operator()(sqlite3* db) const {
        if (sqlite3_close_v2(db) != SQLITE_OK) {
            spdlog::warn("closing note store failed: {}", sqlite3_errmsg(db));
        }
    }
};

struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};
using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

auto store_error(sqlite3* db, std::string_view what) -> StoreError {
    auto message = std::string{what};
    if (db) {
        message += ": ";
        message += sqlite3_errmsg(db);
    }
    return StoreError{message};
}

auto prepare(sqlite3* db, const char* sql) -> Statement {
    if (!db) throw StoreError{"note store is not open"};
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) {
        throw store_error(db, "prepare failed");
    }
    return Statement{raw};
}

void bind_text(sqlite3* db, sqlite3_stmt* stmt, int index, std::string_view value) {
    if (sqlite3_bind_text(stmt, index, value.data(), static_cast<int>(value.size()),
                          SQLITE_TRANSIENT) != SQLITE_OK) {
        throw store_error(db, "bind failed");
    }
}

// Step once; true when a row is available.
auto step(sqlite3* db, sqlite3_stmt* stmt) -> bool {
    auto rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw store_error(db, "query failed");
}

auto column_text(sqlite3_stmt* stmt, int col) -> std::optional<std::string> {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    auto len = sqlite3_column_bytes(stmt, col);
    return std::string{text ? text : "", static_cast<std::size_t>(len)};
}

auto column_int64(sqlite3_stmt* stmt, int col) -> std::optional<std::int64_t> {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return sqlite3_column_int64(stmt, col);
}

auto column_time(sqlite3_stmt* stmt, int col) -> std::optional<std::int64_t> {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return apple_time_to_unix(sqlite3_column_double(stmt, col));
}

auto column_blob(sqlite3_stmt* stmt, int col) -> std::vector<std::byte> {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return {};
    auto* blob = static_cast<const std::byte*>(sqlite3_column_blob(stmt, col));
    auto len = static_cast<std::size_t>(sqlite3_column_bytes(stmt, col));
    if (!blob) return {};
    return std::vector<std::byte>(blob, blob + len);
}

auto query_inline_text(sqlite3* db, std::string_view identifier) -> std::optional<std::string> {
    auto stmt = prepare(db, inline_text_sql);
    bind_text(db, stmt.get(), 1, identifier);
    if (!step(db, stmt.get())) return std::nullopt;
    return column_text(stmt.get(), 0);
}

}  // anonymous namespace

NoteStore::NoteStore(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        throw StoreError{"note store not found at " + path.string()};
    }
    auto uri = "file:" + path.string() + "?mode=ro";
    auto flags = SQLITE_OPEN_READONLY | SQLITE_OPEN_URI | SQLITE_OPEN_FULLMUTEX;
    sqlite3* raw = nullptr;
    auto rc = sqlite3_open_v2(uri.c_str(), &raw, flags, nullptr);
    // sqlite3_open_v2 hands back a handle even on failure; it must be closed.
    db_ = std::shared_ptr<sqlite3>{raw, ConnectionDeleter{}};
    if (rc != SQLITE_OK) {
        auto error = store_error(raw, "cannot open " + path.string());
        db_.reset();
        throw error;
    }
    spdlog::debug("opened note store {}", path.string());
}

auto NoteStore::default_path() -> std::filesystem::path {
    const char* home = std::getenv("HOME");
    auto base = std::filesystem::path{home ? home : "."};
    return base / "Library/Group Containers/group.com.apple.notes/NoteStore.sqlite";
}

auto NoteStore::notes() const -> std::vector<StoredNote> {
    auto* db = db_.get();
    auto stmt = prepare(db, notes_sql);
    auto result = std::vector<StoredNote>{};

    while (step(db, stmt.get())) {
        auto note = StoredNote{};
        note.id = sqlite3_column_int64(stmt.get(), 0);
        note.title = column_text(stmt.get(), 1).value_or("Untitled");
        if (note.title.empty()) note.title = "Untitled";
        note.snippet = column_text(stmt.get(), 2).value_or(std::string{});
        note.created = column_time(stmt.get(), 3);
        note.modified = column_time(stmt.get(), 4);
        note.folder = column_text(stmt.get(), 5);
        note.data = column_blob(stmt.get(), 6);
        result.push_back(std::move(note));
    }

    spdlog::debug("note store listed {} notes", result.size());
    return result;
}

auto NoteStore::inline_text(std::string_view identifier) const -> std::optional<std::string> {
    return query_inline_text(db_.get(), identifier);
}

auto NoteStore::attachment_record(std::string_view identifier) const
    -> std::optional<AttachmentRecord> {
    auto* db = db_.get();
    auto stmt = prepare(db, attachment_sql);
    bind_text(db, stmt.get(), 1, identifier);
    if (!step(db, stmt.get())) return std::nullopt;
    return AttachmentRecord{
        .identifier = column_text(stmt.get(), 0).value_or(std::string{identifier}),
        .type_uti = column_text(stmt.get(), 1).value_or(std::string{}),
        .filename = column_text(stmt.get(), 2),
        .size = column_int64(stmt.get(), 3),
    };
}

auto NoteStore::lookup() const -> AttachmentLookup {
    return [db = db_](std::string_view identifier, std::string_view type_uti)
               -> std::optional<std::string> {
        if (!is_inline(classify_attachment(type_uti))) return std::nullopt;
        return query_inline_text(db.get(), identifier);
    };
}

}  // namespace notetext_cpp
