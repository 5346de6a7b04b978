#pragma once

#include <array>
#include <concepts>
#include <functional>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <boost/pfr.hpp>
#include <fixed_string.hpp>

namespace lazy
{

// Forward declarations needed by detail namespace
template <typename T, fixstr::fixed_string Name> class Field;

//=============================================================================
// Implementation details - not part of the public API
//=============================================================================
namespace detail
{
/**
 * @brief Filters a tuple, keeping only elements that satisfy the Predicate
 *
 * @tparam Predicate A template that provides a ::value bool for each type
 * @param tp The tuple to filter
 * @return A new tuple containing only elements where Predicate<T>::value is true
 */
template <template<typename> class Predicate, typename Tuple>
auto filter_tuple(Tuple&& tp)
{
    return std::apply([]<typename... Ts>(Ts&&... args) {
        // Helper that returns either a single-element tuple or empty tuple
        auto maybe_keep = []<typename T>(T&& arg) {
            if constexpr (Predicate<T>::value)
                return std::tuple<T>(std::forward<T>(arg));
            else
                return std::tuple<>();
        };
        return std::tuple_cat(maybe_keep(std::forward<Ts>(args))...);
    }, std::forward<Tuple>(tp));
}

/**
 * @brief Trait to check if a lambda can be invoked with a given type
 *
 * Provides a nested Predicate template that evaluates to true_type if
 * Lambda can be called with an argument of type T.
 */
template <typename Lambda>
struct DoesLambdaSupportType
{
    template <typename T>
    struct Predicate : std::bool_constant<requires { std::declval<Lambda>()(std::declval<T>()); }> {};
};

//-----------------------------------------------------------------------------
// Field type detection
//-----------------------------------------------------------------------------

template <typename T> struct is_field_helper : std::false_type {};
template <typename T, fixstr::fixed_string Name> struct is_field_helper<Field<T, Name>> : std::true_type {};

/// Predicate that is true if T is a Field<> specialization
template <typename T> struct is_field { static constexpr auto value = is_field_helper<std::decay_t<T>>::value; };

/// Name and value type of a Field<> specialization
template <typename T> struct field_traits;
template <typename T, fixstr::fixed_string Name>
struct field_traits<Field<T, Name>>
{
    using type = T;
    static constexpr auto kFixedName = Name;
    static constexpr std::string_view kName = Name;
};

/// Helper to decay all types in a tuple
template <typename T> struct decay_tuple;
template <typename... Types> struct decay_tuple<std::tuple<Types...>>
{
    using type = std::tuple<std::decay_t<Types>...>;
};

/// Tuple of the (decayed) Field<> member types of the aggregate T, in declaration order
template <typename T>
struct fields_of
{
    static_assert(std::is_aggregate_v<T>, "A record shape must be an aggregate struct of Field<> members");
    using type = typename decay_tuple<decltype(filter_tuple<is_field>(boost::pfr::structure_tie(std::declval<T&>())))>::type;
};

/// Ties every Field<> member of the aggregate u, in declaration order
template <typename T>
auto tie_fields(T& u)
{
    return filter_tuple<is_field>(boost::pfr::structure_tie(u));
}

//-----------------------------------------------------------------------------
// Compile-time field lookup by name
//-----------------------------------------------------------------------------

/**
 * @brief Index of the field called FieldName within a tuple of Field<> types
 *
 * Evaluates to the tuple size if no field carries that name.
 */
template <fixstr::fixed_string FieldName, typename Tuple> struct field_index;

template <fixstr::fixed_string FieldName, typename... Fields>
struct field_index<FieldName, std::tuple<Fields...>>
{
    static constexpr std::size_t value = std::invoke([]
    {
        constexpr std::string_view name = FieldName;
        constexpr std::array<std::string_view, sizeof...(Fields)> names = {{ field_traits<Fields>::kName... }};

        for (std::size_t i = 0; i < names.size(); ++i)
            if (names[i] == name)
                return i;

        return names.size();
    });
};

/// The Field<> type called FieldName within a tuple of Field<> types
template <fixstr::fixed_string FieldName, typename Tuple>
using field_by_name = std::tuple_element_t<field_index<FieldName, Tuple>::value, Tuple>;

template<template<typename, typename> class Cls, typename T>
struct BindFirst
{
    template <typename U>
    struct Result
    {
        using type = Cls<T, U>;
    };
};

/// Helper to transform tuple element types
template <typename Tuple, template<typename> class Transform>
struct transform_tuple;

template <typename... Ts, template<typename> class Transform>
struct transform_tuple<std::tuple<Ts...>, Transform> {
    using type = std::tuple<typename Transform<Ts>::type...>;
};

// Helper class to transform a tuple to a variant
template <template<typename...> class Transform, typename Tuple>
struct apply_tuple;

template <template<typename...> class Transform, typename... Ts>
struct apply_tuple<Transform, std::tuple<Ts...>> {
    using type = Transform<Ts...>;
};

template <typename T> struct add_const_lvalue_ref { using type = T const&; };
template <typename T> struct add_const_reference_wrapper { using type = std::reference_wrapper<T const>; };

/// True if T is one of the types in Tuple
template <typename T, typename Tuple> struct is_one_of;
template <typename T, typename... Ts>
struct is_one_of<T, std::tuple<Ts...>> : std::bool_constant<(std::is_same_v<T, Ts> || ...)> {};
} // namespace detail

} // namespace lazy
