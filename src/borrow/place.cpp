#include "borrowck/borrow/place.hpp"

namespace borrowck::borrow {

auto Place::is_prefix_of(const Place& other) const -> bool {
    if (root != other.root || fields.size() > other.fields.size()) {
        return false;
    }
    for (size_t i = 0; i < fields.size(); ++i) {
        if (fields[i] != other.fields[i]) {
            return false;
        }
    }
    return true;
}

auto Place::overlaps(const Place& other) const -> bool {
    return is_prefix_of(other) || other.is_prefix_of(*this);
}

auto Place::to_string(const ScopeTable& scopes) const -> std::string {
    std::string out = scopes.binding(root).name;
    for (const auto& field : fields) {
        out += "." + field;
    }
    if (through_index) {
        out += "[..]";
    }
    if (through_deref) {
        out = "*" + out;
    }
    return out;
}

auto extract_place(const ast::Expr& expr, const ScopeTable& scopes) -> std::optional<Place> {
    if (expr.is<ast::IdentExpr>()) {
        Place place;
        place.root = scopes.resolve(expr.as<ast::IdentExpr>().name);
        return place;
    }

    if (expr.is<ast::FieldExpr>()) {
        auto place = extract_place(*expr.as<ast::FieldExpr>().object, scopes);
        if (place && !place->through_deref && !place->through_index) {
            place->fields.push_back(expr.as<ast::FieldExpr>().field);
        }
        return place;
    }

    if (expr.is<ast::IndexExpr>()) {
        auto place = extract_place(*expr.as<ast::IndexExpr>().object, scopes);
        if (place) {
            place->through_index = true;
        }
        return place;
    }

    if (expr.is<ast::UnaryExpr>() && expr.as<ast::UnaryExpr>().op == ast::UnaryOp::Deref) {
        auto place = extract_place(*expr.as<ast::UnaryExpr>().operand, scopes);
        if (place) {
            place->through_deref = true;
        }
        return place;
    }

    return std::nullopt;
}

} // namespace borrowck::borrow
