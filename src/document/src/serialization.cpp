#include "cpak/document/serialization.h"
#include "cpak/core/errors.h"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <regex>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace cpak::document {

namespace {

std::string
format_double(double value)
{
    char buffer[32];
    auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
    if (ec != std::errc())
        return boost::json::serialize(boost::json::value(value));
    return std::string(buffer, end);
}

void
print_newline(std::ostream& os, int indent, int depth)
{
    if (indent <= 0)
        return;
    os << '\n' << std::string(static_cast<std::size_t>(indent * depth), ' ');
}

void
pretty_print_impl(
    std::ostream& os,
    const boost::json::value& jv,
    int indent,
    int depth)
{
    switch (jv.kind())
    {
        case boost::json::kind::object: {
            const auto& obj = jv.get_object();
            if (obj.empty())
            {
                os << "{}";
                break;
            }
            os << "{";
            for (auto it = obj.begin(); it != obj.end(); ++it)
            {
                if (it != obj.begin())
                    os << ",";
                print_newline(os, indent, depth + 1);
                os << boost::json::serialize(it->key())
                   << (indent > 0 ? ": " : ":");
                pretty_print_impl(os, it->value(), indent, depth + 1);
            }
            print_newline(os, indent, depth);
            os << "}";
            break;
        }
        case boost::json::kind::array: {
            const auto& arr = jv.get_array();
            if (arr.empty())
            {
                os << "[]";
                break;
            }
            os << "[";
            for (auto it = arr.begin(); it != arr.end(); ++it)
            {
                if (it != arr.begin())
                    os << ",";
                print_newline(os, indent, depth + 1);
                pretty_print_impl(os, *it, indent, depth + 1);
            }
            print_newline(os, indent, depth);
            os << "]";
            break;
        }
        case boost::json::kind::string:
            os << boost::json::serialize(jv.get_string());
            break;
        case boost::json::kind::uint64:
            os << jv.get_uint64();
            break;
        case boost::json::kind::int64:
            os << jv.get_int64();
            break;
        case boost::json::kind::double_:
            os << format_double(jv.get_double());
            break;
        case boost::json::kind::bool_:
            os << (jv.get_bool() ? "true" : "false");
            break;
        case boost::json::kind::null:
            os << "null";
            break;
    }
}

template <typename T>
bool
parse_number(const std::string& text, T& out)
{
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, out);
    return ec == std::errc() && ptr == end;
}

// Interpret an untagged plain YAML scalar the way the core schema does
boost::json::value
plain_scalar_to_json(const std::string& text)
{
    if (text.empty() || text == "~" || text == "null" || text == "Null" ||
        text == "NULL")
        return nullptr;
    if (text == "true" || text == "True" || text == "TRUE")
        return true;
    if (text == "false" || text == "False" || text == "FALSE")
        return false;

    std::int64_t i = 0;
    if (parse_number(text, i))
        return i;
    std::uint64_t u = 0;
    if (parse_number(text, u))
        return u;
    double d = 0;
    if (parse_number(text, d) && std::isfinite(d))
        return d;

    return boost::json::string(text);
}

boost::json::value
yaml_to_json(const YAML::Node& node)
{
    switch (node.Type())
    {
        case YAML::NodeType::Undefined:
        case YAML::NodeType::Null:
            return nullptr;
        case YAML::NodeType::Scalar:
            // Quoted scalars carry the non-specific "!" tag
            if (node.Tag() == "!")
                return boost::json::string(node.Scalar());
            return plain_scalar_to_json(node.Scalar());
        case YAML::NodeType::Sequence: {
            boost::json::array array;
            array.reserve(node.size());
            for (const auto& element : node)
                array.push_back(yaml_to_json(element));
            return array;
        }
        case YAML::NodeType::Map: {
            boost::json::object object;
            object.reserve(node.size());
            for (const auto& member : node)
            {
                object[member.first.as<std::string>()] =
                    yaml_to_json(member.second);
            }
            return object;
        }
    }
    return nullptr;
}

// Plain scalars that YAML 1.1 or core-schema readers resolve to booleans,
// numbers, timestamps or merge keys, even where plain_scalar_to_json does not
bool
resolves_as_non_string(const std::string& text)
{
    static const std::regex pattern(
        "y|Y|yes|Yes|YES|n|N|no|No|NO|on|On|ON|off|Off|OFF"
        "|[-+]?0b[01_]+"
        "|[-+]?0o?[0-7_]+"
        "|[-+]?0x[0-9a-fA-F_]+"
        "|[-+]?[0-9][0-9_]*"
        "|[-+]?[0-9][0-9_]*(:[0-5]?[0-9])+(\\.[0-9_]*)?"
        "|[-+]?([0-9][0-9_]*)?\\.[0-9_]*([eE][-+]?[0-9]+)?"
        "|[-+]?[0-9][0-9_]*[eE][-+]?[0-9]+"
        "|[-+]?\\.(inf|Inf|INF)"
        "|\\.(nan|NaN|NAN)"
        "|[0-9]{4}-[0-9]{1,2}-[0-9]{1,2}([Tt \\t].*)?"
        "|<<|=");
    return std::regex_match(text, pattern);
}

void
emit_string(YAML::Emitter& out, boost::json::string_view text)
{
    std::string str(text.data(), text.size());
    // Anything a reader would not take back as this same string is quoted
    if (!plain_scalar_to_json(str).is_string() || resolves_as_non_string(str))
        out << YAML::DoubleQuoted;
    out << str;
}

void
emit_yaml(YAML::Emitter& out, const boost::json::value& jv)
{
    switch (jv.kind())
    {
        case boost::json::kind::object:
            out << YAML::BeginMap;
            for (const auto& member : jv.get_object())
            {
                out << YAML::Key;
                emit_string(out, member.key());
                out << YAML::Value;
                emit_yaml(out, member.value());
            }
            out << YAML::EndMap;
            break;
        case boost::json::kind::array:
            out << YAML::BeginSeq;
            for (const auto& element : jv.get_array())
                emit_yaml(out, element);
            out << YAML::EndSeq;
            break;
        case boost::json::kind::string:
            emit_string(out, jv.get_string());
            break;
        case boost::json::kind::uint64:
            out << static_cast<unsigned long long>(jv.get_uint64());
            break;
        case boost::json::kind::int64:
            out << static_cast<long long>(jv.get_int64());
            break;
        case boost::json::kind::double_:
            out << format_double(jv.get_double());
            break;
        case boost::json::kind::bool_:
            out << jv.get_bool();
            break;
        case boost::json::kind::null:
            out << YAML::Null;
            break;
    }
}

}  // namespace

std::string_view
file_extension(Format format)
{
    return format == Format::YAML ? "yml" : "json";
}

bool
has_format_extension(const boost::filesystem::path& path, Format format)
{
    auto ext = path.extension().string();
    if (format == Format::YAML)
        return ext == ".yml" || ext == ".yaml";
    return ext == ".json";
}

boost::json::value
parse_text(std::string_view text, Format format)
{
    if (format == Format::JSON)
    {
        boost::system::error_code ec;
        boost::json::value jv = boost::json::parse(text, ec);
        if (ec)
            throw ParseError("invalid JSON: " + ec.message());
        return jv;
    }

    try
    {
        return yaml_to_json(YAML::Load(std::string(text)));
    }
    catch (const YAML::Exception& e)
    {
        throw ParseError(std::string("invalid YAML: ") + e.what());
    }
}

void
pretty_print(std::ostream& os, const boost::json::value& jv, int indent)
{
    pretty_print_impl(os, jv, indent, 0);
}

std::string
serialize(const boost::json::value& jv, const SerializeOptions& options)
{
    if (options.format == Format::YAML)
    {
        YAML::Emitter out;
        out.SetIndent(options.yaml.indent);
        emit_yaml(out, jv);
        if (!out.good())
        {
            throw ParseError(
                "failed to emit YAML: " + out.GetLastError());
        }
        return std::string(out.c_str()) + "\n";
    }

    std::ostringstream oss;
    pretty_print(oss, jv, options.json.indent);
    oss << "\n";
    return oss.str();
}

boost::json::value
read_file(const boost::filesystem::path& path, Format format)
{
    std::ifstream file(path.string(), std::ios::binary);
    if (!file.is_open())
    {
        throw boost::filesystem::filesystem_error(
            "Could not open file",
            path,
            boost::system::errc::make_error_code(
                boost::system::errc::no_such_file_or_directory));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    try
    {
        return parse_text(buffer.str(), format);
    }
    catch (const ParseError& e)
    {
        throw ParseError(path.string(), e.what());
    }
}

void
write_file(
    const boost::json::value& jv,
    const boost::filesystem::path& path,
    const SerializeOptions& options)
{
    if (path.has_parent_path())
        boost::filesystem::create_directories(path.parent_path());

    std::string text = serialize(jv, options);

    std::ofstream file(path.string(), std::ios::binary | std::ios::trunc);
    if (!file.is_open())
    {
        throw boost::filesystem::filesystem_error(
            "Could not open file for writing",
            path,
            boost::system::errc::make_error_code(boost::system::errc::io_error));
    }
    file.write(text.data(), static_cast<std::streamsize>(text.size()));
    if (!file)
    {
        throw boost::filesystem::filesystem_error(
            "Failed to write file",
            path,
            boost::system::errc::make_error_code(boost::system::errc::io_error));
    }
}

}  // namespace cpak::document
