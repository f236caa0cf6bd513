#pragma once

#include "cpak/document/document.h"

#include <functional>
#include <optional>
#include <string>

namespace cpak::pack {

// What an entry transform wants done with the document it was given
enum class EntryAction { KEEP, DISCARD };

/**
 * Called once per primary document. May mutate the document in place.
 */
using EntryTransform = std::function<EntryAction(document::Document&)>;

struct NameContext
{
    // Relative directory of the document's folder, when known
    std::optional<std::string> folder;
};

/**
 * Derive the output path (relative to the destination directory) of an
 * extracted document. An empty result falls back to the default name.
 */
using NameTransform = std::function<std::string(
    const document::Document&,
    const NameContext&)>;

/**
 * Derive the directory name of a folder record. An empty result falls back
 * to the default name.
 */
using FolderNameTransform =
    std::function<std::string(const document::Document&)>;

}  // namespace cpak::pack
