/// @file notetext.hpp
/// @brief Umbrella header for the notetext-cpp library.
///
/// Include this single header for access to all public types:
/// NoteStoreDecoder, resolve_attachments, extract_fallback_text,
/// decode_note, decode_notes, NoteStore, and Error.

#pragma once

#include <notetext-cpp/batch.hpp>
#include <notetext-cpp/decoder.hpp>
#include <notetext-cpp/error.hpp>
#include <notetext-cpp/fallback.hpp>
#include <notetext-cpp/note.hpp>
#include <notetext-cpp/note_store.hpp>
#include <notetext-cpp/resolver.hpp>
#include <notetext-cpp/types.hpp>
