#pragma once

#include <string>
#include <utility>
#include <vector>

namespace level
{

enum class LevelErrorKind
{
    UnknownLegacyVariant,
    MalformedDocument,
    IoFailure
};

inline const char *levelErrorKindToString(LevelErrorKind kind)
{
    switch (kind)
    {
    case LevelErrorKind::UnknownLegacyVariant:
        return "unknown_legacy_variant";
    case LevelErrorKind::MalformedDocument:
        return "malformed_document";
    case LevelErrorKind::IoFailure:
        return "io_failure";
    }
    return "malformed_document";
}

struct LevelError
{
    LevelErrorKind kind = LevelErrorKind::MalformedDocument;
    // JSON-pointer-like path inside the document, e.g. "lasers[2].kind".
    std::string location;
    std::string message;

    std::string describe() const
    {
        if (location.empty())
        {
            return message;
        }
        return location + ": " + message;
    }
};

// Carries the error sink and the current document location through the decoders.
struct DecodeContext
{
    std::vector<LevelError> *errors = nullptr;
    std::string location;

    DecodeContext child(const std::string &key) const
    {
        DecodeContext next;
        next.errors = errors;
        next.location = location.empty() ? key : location + "." + key;
        return next;
    }

    DecodeContext element(std::size_t index) const
    {
        DecodeContext next;
        next.errors = errors;
        next.location = location + "[" + std::to_string(index) + "]";
        return next;
    }

    void report(LevelErrorKind kind, std::string message) const
    {
        if (errors)
        {
            errors->push_back({kind, location, std::move(message)});
        }
    }

    void malformed(std::string message) const
    {
        report(LevelErrorKind::MalformedDocument, std::move(message));
    }
};

} // namespace level
