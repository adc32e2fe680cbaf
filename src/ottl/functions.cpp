#include "functions.hpp"

namespace ottl {

const char* argKindName(ArgKind kind) {
    switch (kind) {
        case ArgKind::Getter: return "getter";
        case ArgKind::GetSetter: return "path";
        case ArgKind::StringGetter: return "string getter";
        case ArgKind::StringLikeGetter: return "string-like getter";
        case ArgKind::IntGetter: return "int getter";
        case ArgKind::IntLikeGetter: return "int-like getter";
        case ArgKind::FloatGetter: return "float getter";
        case ArgKind::FloatLikeGetter: return "float-like getter";
        case ArgKind::BoolGetter: return "bool getter";
        case ArgKind::BoolLikeGetter: return "bool-like getter";
        case ArgKind::MapGetter: return "map getter";
        case ArgKind::SliceGetter: return "slice getter";
        case ArgKind::TimeGetter: return "time getter";
        case ArgKind::DurationGetter: return "duration getter";
        case ArgKind::ByteSliceLikeGetter: return "byte-slice-like getter";
        case ArgKind::StringLiteral: return "string literal";
        case ArgKind::IntLiteral: return "int literal";
        case ArgKind::FloatLiteral: return "float literal";
        case ArgKind::BoolLiteral: return "bool literal";
        case ArgKind::StringList: return "list of string literals";
        case ArgKind::GetterList: return "list of values";
        case ArgKind::StringLikeGetterList: return "list of values";
        case ArgKind::Enum: return "enum";
        case ArgKind::Function: return "function name";
    }
    return "argument";
}

} // namespace ottl
