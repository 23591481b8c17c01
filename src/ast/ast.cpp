#include "borrowck/ast/ast.hpp"

namespace borrowck::ast {

auto is_assignment(BinaryOp op) -> bool {
    switch (op) {
    case BinaryOp::Assign:
    case BinaryOp::AddAssign:
    case BinaryOp::SubAssign:
    case BinaryOp::MulAssign:
    case BinaryOp::DivAssign:
    case BinaryOp::ModAssign:
        return true;
    default:
        return false;
    }
}

auto is_comparison(BinaryOp op) -> bool {
    switch (op) {
    case BinaryOp::Eq:
    case BinaryOp::Ne:
    case BinaryOp::Lt:
    case BinaryOp::Gt:
    case BinaryOp::Le:
    case BinaryOp::Ge:
    case BinaryOp::And:
    case BinaryOp::Or:
        return true;
    default:
        return false;
    }
}

auto binary_op_to_string(BinaryOp op) -> const char* {
    switch (op) {
    case BinaryOp::Add:
        return "+";
    case BinaryOp::Sub:
        return "-";
    case BinaryOp::Mul:
        return "*";
    case BinaryOp::Div:
        return "/";
    case BinaryOp::Mod:
        return "%";
    case BinaryOp::Eq:
        return "==";
    case BinaryOp::Ne:
        return "!=";
    case BinaryOp::Lt:
        return "<";
    case BinaryOp::Gt:
        return ">";
    case BinaryOp::Le:
        return "<=";
    case BinaryOp::Ge:
        return ">=";
    case BinaryOp::And:
        return "and";
    case BinaryOp::Or:
        return "or";
    case BinaryOp::Assign:
        return "=";
    case BinaryOp::AddAssign:
        return "+=";
    case BinaryOp::SubAssign:
        return "-=";
    case BinaryOp::MulAssign:
        return "*=";
    case BinaryOp::DivAssign:
        return "/=";
    case BinaryOp::ModAssign:
        return "%=";
    }
    return "?";
}

auto FuncDecl::signature() const -> types::FuncSig {
    types::FuncSig sig;
    sig.name = name;
    sig.return_type = return_type;
    sig.is_mutating = is_mutating;
    for (const auto& param : params) {
        sig.params.push_back(param.type);
    }
    if (receiver) {
        sig.receiver = receiver->kind;
    }
    return sig;
}

} // namespace borrowck::ast
