#include "cpak/pack/filenames.h"

#include <algorithm>
#include <boost/locale.hpp>

namespace cpak::pack {

namespace {

const std::locale&
utf8_locale()
{
    static const std::locale loc = [] {
        boost::locale::generator gen;
        return gen("en_US.UTF-8");
    }();
    return loc;
}

bool
is_kept(char32_t cp)
{
    return (cp >= U'a' && cp <= U'z') || (cp >= U'A' && cp <= U'Z') ||
        (cp >= U'0' && cp <= U'9') || (cp >= 0x0300 && cp <= 0x036F);
}

}  // namespace

std::string
safe_filename(std::string_view name)
{
    std::string decomposed = boost::locale::normalize(
        std::string(name), boost::locale::norm_nfd, utf8_locale());

    std::u32string code_points =
        boost::locale::conv::utf_to_utf<char32_t>(decomposed);
    for (auto& cp : code_points)
    {
        if (!is_kept(cp))
            cp = U'_';
    }
    return boost::locale::conv::utf_to_utf<char>(code_points);
}

std::string
display_name(
    const std::optional<std::string>& name,
    std::string_view id,
    std::string_view fallback)
{
    if (!name || name->empty())
        return std::string(fallback);
    return safe_filename(*name) + "_" + std::string(id);
}

std::vector<boost::filesystem::path>
find_source_files(
    const boost::filesystem::path& root,
    document::Format format,
    bool recursive)
{
    namespace fs = boost::filesystem;

    std::vector<fs::path> files;
    auto consider = [&](const fs::directory_entry& entry) {
        if (fs::is_regular_file(entry.status()) &&
            document::has_format_extension(entry.path(), format))
            files.push_back(entry.path());
    };

    if (recursive)
    {
        for (const auto& entry : fs::recursive_directory_iterator(root))
            consider(entry);
    }
    else
    {
        for (const auto& entry : fs::directory_iterator(root))
            consider(entry);
    }

    std::sort(files.begin(), files.end());
    return files;
}

}  // namespace cpak::pack
