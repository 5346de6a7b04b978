#pragma once

namespace lazy
{

//=============================================================================
// Value implementations
//=============================================================================
template <typename Lambda>
auto Value::visit(Lambda && lambda) const -> decltype(auto)
{
    using AllArgumentTypes = decltype(std::tuple_cat(std::declval<std::tuple<Invalid>>(), std::declval<SupportedFundamentalTypes>()));
    using AllArgumentRefs = detail::transform_tuple<AllArgumentTypes, detail::add_const_lvalue_ref>::type;
    using SupportedArgumentsByLambda = decltype(detail::filter_tuple<detail::DoesLambdaSupportType<Lambda>::template Predicate>(std::declval<AllArgumentRefs>()));
    static_assert(std::tuple_size_v<SupportedArgumentsByLambda> >= 1, "Your lambda must be callable with at least one of the types in SupportedFundamentalTypes");

    using LambdaReturnTypes = detail::transform_tuple<SupportedArgumentsByLambda, detail::BindFirst<std::invoke_result_t, Lambda>::template Result>::type;
    using LambdaReturnType = detail::apply_tuple<std::common_type, LambdaReturnTypes>::type::type;
    static_assert(std::is_void_v<LambdaReturnType> || std::is_default_constructible_v<LambdaReturnType>,
                  "A visitor returning a value must return a default constructible type");

    if (! isValid())
    {
        if constexpr (std::is_invocable_v<Lambda, Invalid const&>)
            return static_cast<LambdaReturnType>(lambda(static_cast<Invalid const&>(*this)));
        else
            return LambdaReturnType();
    }

    return std::visit([&lambda] <typename Alternative> (Alternative const& alternative) -> LambdaReturnType
    {
        if constexpr (! std::is_same_v<Alternative, std::monostate>)
        {
            using Type = typename Alternative::type;

            if constexpr (std::is_invocable_v<Lambda, Type const&>)
                return static_cast<LambdaReturnType>(lambda(alternative.get()));
        }

        return LambdaReturnType();
    }, visit_helper());
}

template <typename T>
T const* Value::getIf() const
{
    if constexpr (isSupported<T>())
    {
        if (type() == typeid(T))
            return &static_cast<Fundamental<T> const&>(*this)();
    }

    return nullptr;
}

//=============================================================================
// Fundamental implementations
//=============================================================================

template <typename T>
Fundamental<T>::Fundamental() : underlying() {}

template <typename T>
Fundamental<T>::Fundamental(T underlying_) : underlying(std::move(underlying_)) {}

template <typename T>
Fundamental<T>& Fundamental<T>::operator=(T const& newValue)
{
    set(newValue);
    return *this;
}

template <typename T>
void Fundamental<T>::set(T newValue)
{
    underlying = std::move(newValue);
}

template <typename T>
std::unique_ptr<Value> Fundamental<T>::clone() const
{
    return std::make_unique<Fundamental<T>>(*this);
}

template <typename T>
bool Fundamental<T>::assign(Value const& other)
{
    if (type() != other.type())
        return false;

    set(static_cast<Fundamental<T> const&>(other).underlying);
    return true;
}

template <typename T>
typename Value::ConstTypesVariant Fundamental<T>::visit_helper() const
{
    return {std::reference_wrapper<T const>(underlying)};
}

//=============================================================================
// operator""_fld implementation
//=============================================================================
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wpedantic"
#ifdef __clang__
#    pragma GCC diagnostic ignored "-Wgnu-string-literal-operator-template"
#endif
template <typename T, T... chars>
constexpr CompileTimeString<fixstr::fixed_string<sizeof...(chars)>({chars...})> operator""_fld()
{
    return { };
}
#pragma GCC diagnostic pop

//=============================================================================
// Field implementations
//=============================================================================

template <typename T, fixstr::fixed_string Name>
Field<T, Name>& Field<T, Name>::operator=(T const& t)
{
    std::optional<T>::operator=(t);
    return *this;
}

template <typename T, fixstr::fixed_string Name>
Field<T, Name>& Field<T, Name>::operator=(T && t)
{
    std::optional<T>::operator=(std::move(t));
    return *this;
}

template <typename T, fixstr::fixed_string Name>
std::string Field<T, Name>::fieldname() const
{
    return std::string(std::string_view(Name));
}

//=============================================================================
// Object implementations
//=============================================================================

template <typename T>
Value const& Object::set(std::string_view name, T newValue) requires (Value::isSupported<T>())
{
    return store(name, std::make_unique<Fundamental<T>>(std::move(newValue)));
}

//=============================================================================
// Specification implementations
//=============================================================================

template <typename From, typename To>
template <fixstr::fixed_string FieldName, typename Lambda>
Specification<From, To>& Specification<From, To>::rule(CompileTimeString<FieldName>, Lambda && lambda)
{
    static constexpr auto kIndex = detail::field_index<FieldName, FieldsAsTuple>::value;
    static_assert(kIndex < kFieldNames.size(), "The record shape has no Field<> with this name");

    using T = FieldType<FieldName>;
    using RecordType = Record<From, To>;

    ComputeFunction function;

    if constexpr (std::is_invocable_v<Lambda, From const&, RecordType const&>)
    {
        static_assert(std::is_convertible_v<std::invoke_result_t<Lambda, From const&, RecordType const&>, T>,
                      "The compute function's result must convert to the field's type");

        function = [lambda_ = std::forward<Lambda>(lambda)] (From const& source, RecordType const& self) -> std::unique_ptr<Value>
        {
            return std::make_unique<Fundamental<T>>(static_cast<T>(std::invoke(lambda_, source, self)));
        };
    }
    else
    {
        static_assert(std::is_invocable_v<Lambda, From const&>,
                      "A compute function takes (From const&) or (From const&, Record<From, To> const&)");
        static_assert(std::is_convertible_v<std::invoke_result_t<Lambda, From const&>, T>,
                      "The compute function's result must convert to the field's type");

        function = [lambda_ = std::forward<Lambda>(lambda)] (From const& source, RecordType const&) -> std::unique_ptr<Value>
        {
            return std::make_unique<Fundamental<T>>(static_cast<T>(std::invoke(lambda_, source)));
        };
    }

    // keep rules ordered by declaration order of the shape
    auto it = std::lower_bound(rules.begin(), rules.end(), kIndex, [] (Rule const& r, std::size_t idx) { return r.index < idx; });
    auto const pos = static_cast<std::ptrdiff_t>(std::distance(rules.begin(), it));

    if (it != rules.end() && it->index == kIndex)
    {
        it->function = std::move(function);
        return *this;
    }

    rules.insert(it, Rule { kIndex, std::move(function) });
    names.emplace(names.begin() + pos, kFieldNames[kIndex]);
    return *this;
}

template <typename From, typename To>
bool Specification<From, To>::contains(std::string_view name) const
{
    return std::find(names.begin(), names.end(), name) != names.end();
}

template <typename From, typename To>
std::unique_ptr<Value> Specification<From, To>::compute(std::string_view name, From const& source, Record<From, To> const& self) const
{
    auto it = std::find(names.begin(), names.end(), name);

    if (it == names.end()) // no rule with this name?
        return nullptr;

    return rules[static_cast<std::size_t>(std::distance(names.begin(), it))].function(source, self);
}

//=============================================================================
// Record implementations
//=============================================================================

template <typename From, typename To>
Record<From, To>::Record(std::shared_ptr<SpecificationType const> specification_, From source_, Options options_)
    : Object(options_), spec(std::move(specification_)), src(std::move(source_))
{}

template <typename From, typename To>
To Record<From, To>::snapshot() const
{
    To result {};

    std::apply([this] <typename... Fields> (Fields &&... flds)
    {
        (std::invoke([this] (auto& fld)
        {
            using FieldT = std::remove_cvref_t<decltype(fld)>;

            if (auto value = (*this)(CompileTimeString<detail::field_traits<FieldT>::kFixedName>()))
                fld = std::move(*value);
        }, flds), ...);
    }, detail::tie_fields(result));

    return result;
}

template <typename From, typename To>
std::unique_ptr<Value> Record<From, To>::compute(std::string_view name) const
{
    return spec->compute(name, src, *this);
}

//=============================================================================
// Factory implementations
//=============================================================================

template <typename From, typename To>
Factory<From, To>::Factory(std::shared_ptr<Specification<From, To> const> specification_, Options options_)
    : spec(std::move(specification_)), opts(options_)
{}

template <typename From, typename To>
Record<From, To> Factory<From, To>::operator()(From source) const
{
    return Record<From, To>(spec, std::move(source), opts);
}

template <typename From, typename To>
Factory<From, To> mapping(Specification<From, To> specification, Options options)
{
    return Factory<From, To>(std::make_shared<Specification<From, To> const>(std::move(specification)), options);
}

//=============================================================================
// Stream operators implementations
//=============================================================================

inline std::ostream& operator<<(std::ostream& o, Invalid const&)
{
    return o;
}

inline std::ostream& operator<<(std::ostream& o, Value const& x)
{
    x.visit([&o] (auto const& underlying) { o << underlying; });
    return o;
}

inline std::ostream& operator<<(std::ostream& o, Object const& x)
{
    o << "{ ";
    auto first = true;

    for (auto const& key : x.keys())
    {
        if (! std::exchange(first, false))
            o << ", ";

        o << "." << key << " = " << x.get(key);
    }

    o << " }";
    return o;
}

} // namespace lazy

//=============================================================================
// std::formatter implementations
//=============================================================================

inline auto std::formatter<lazy::Object>::format(lazy::Object const& v, format_context& ctx) const
{
    std::ostringstream ss;
    ss << v;
    return std::formatter<string>::format(ss.str(), ctx);
}

template<typename CharT>
template<class FmtContext>
FmtContext::iterator std::formatter<lazy::Value, CharT>::format(lazy::Value const& v, FmtContext& ctx) const
{
    auto out = ctx.out();

    v.visit([&out, &ctx] <typename T> (T const& underlying)
    {
        if constexpr (! std::is_same_v<T, lazy::Invalid>)
            out = std::formatter<T, CharT>{}.format(underlying, ctx);
    });

    return out;
}
