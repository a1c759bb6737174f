#include <mica/type.hh>

auto mica::Type::Function(std::vector<Type> params, Type result) -> Type {
    MICA_ASSERT(not params.empty(), "Function types take at least one parameter");
    params.push_back(std::move(result));
    return Type{Kind::Function, {}, std::move(params), 0};
}

auto mica::Type::applied() const -> Type {
    if (params().size() == 1) return result();
    return Function({_children.begin() + 1, _children.end() - 1}, result());
}

bool mica::Type::mentions(usz number) const {
    switch (_kind) {
        case Kind::Named: return false;
        case Kind::Variable: return _variable == number;
        case Kind::Function:
            return rgs::any_of(_children, [&](const Type& t) { return t.mentions(number); });
    }
    MICA_UNREACHABLE();
}

auto mica::Type::string() const -> std::string {
    switch (_kind) {
        case Kind::Named: return _name;

        // Variables print as 'a, 'b, ... 'z, then 't26, 't27, ...
        case Kind::Variable:
            if (_variable < 26) return fmt::format("'{}", char('a' + _variable));
            return fmt::format("'t{}", _variable);

        case Kind::Function: {
            std::string out;
            for (const auto& p : params()) {
                if (p.is_function()) out += fmt::format("({}) -> ", p.string());
                else out += fmt::format("{} -> ", p.string());
            }
            out += result().string();
            return out;
        }
    }
    MICA_UNREACHABLE();
}

bool mica::operator==(const Type& a, const Type& b) {
    if (a._kind != b._kind) return false;
    switch (a._kind) {
        case Type::Kind::Named: return a._name == b._name;
        case Type::Kind::Variable: return a._variable == b._variable;
        case Type::Kind::Function: return a._children == b._children;
    }
    MICA_UNREACHABLE();
}
