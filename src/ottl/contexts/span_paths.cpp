#include "span_paths.hpp"

namespace ottl {
namespace contexts {

namespace {

const char* const kKindNames[] = {"Unspecified", "Internal", "Server", "Client", "Producer", "Consumer"};

} // namespace

const char* spanKindName(int kind) {
    if (kind < 0 || kind >= static_cast<int>(sizeof(kKindNames) / sizeof(kKindNames[0]))) {
        return "";
    }
    return kKindNames[kind];
}

std::optional<int> spanKindFromName(const std::string& name) {
    for (int i = 0; i < static_cast<int>(sizeof(kKindNames) / sizeof(kKindNames[0])); ++i) {
        if (name == kKindNames[i]) {
            return i;
        }
    }
    return std::nullopt;
}

std::optional<int> spanKindFromEnumName(const std::string& name) {
    Span::SpanKind kind;
    if (Span::SpanKind_Parse(name, &kind)) {
        return static_cast<int>(kind);
    }
    return std::nullopt;
}

std::optional<int64_t> parseSpanEnum(const std::string& symbol) {
    Span::SpanKind kind;
    if (Span::SpanKind_Parse(symbol, &kind)) {
        return static_cast<int64_t>(kind);
    }
    opentelemetry::proto::trace::v1::Status::StatusCode code;
    if (opentelemetry::proto::trace::v1::Status::StatusCode_Parse(symbol, &code)) {
        return static_cast<int64_t>(code);
    }
    return std::nullopt;
}

} // namespace contexts
} // namespace ottl
