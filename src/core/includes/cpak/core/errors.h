#pragma once

#include <stdexcept>
#include <string>

namespace cpak {

// Base exception for pack compile/extract failures
class PackError : public std::runtime_error
{
public:
    explicit PackError(const std::string& msg) : std::runtime_error(msg)
    {
    }
};

// Two nodes claimed the same composite key, or the folder graph is cyclic
class IntegrityError : public PackError
{
public:
    explicit IntegrityError(const std::string& msg) : PackError(msg)
    {
    }
};

// A required option is missing or invalid
class ConfigurationError : public PackError
{
public:
    explicit ConfigurationError(const std::string& msg)
        : PackError("Configuration: " + msg)
    {
    }
};

// Malformed source content
class ParseError : public PackError
{
public:
    explicit ParseError(const std::string& msg) : PackError(msg)
    {
    }

    ParseError(const std::string& path, const std::string& msg)
        : PackError("Failed to parse " + path + ": " + msg)
    {
    }
};

// Document shape does not match the hierarchy schema
class SchemaError : public ParseError
{
public:
    explicit SchemaError(const std::string& msg) : ParseError("Schema: " + msg)
    {
    }
};

// Malformed composite key
class KeyError : public ParseError
{
public:
    explicit KeyError(const std::string& msg) : ParseError("Key: " + msg)
    {
    }
};

// An embedded record referenced by its parent is missing from the store
class ResolutionError : public PackError
{
public:
    explicit ResolutionError(const std::string& msg) : PackError(msg)
    {
    }
};

// A caller-supplied transform hook failed
class TransformError : public PackError
{
public:
    TransformError(const std::string& path, const std::string& msg)
        : PackError("Transform failed for " + path + ": " + msg)
    {
    }
};

// Underlying store failure
class StoreError : public PackError
{
public:
    explicit StoreError(const std::string& msg) : PackError("Store: " + msg)
    {
    }
};

}  // namespace cpak
