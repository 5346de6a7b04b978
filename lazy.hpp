/**
 * @file lazy.hpp
 * @brief Lazily computed, memoized records
 *
 * A lazy record looks and behaves like an ordinary mutable key-value record,
 * but the values of its declared fields are only computed when they are first
 * read, and then memoized. Field names and types are declared with a shape
 * struct whose members are wrapped in Field<T, Name>; a Specification maps
 * each field to a compute function of the source value:
 *
 * Usage example:
 *   struct Contact { std::string first, last; };
 *   struct Person {
 *       Field<std::string, "name">     name;
 *       Field<std::string, "greeting"> greeting;
 *   };
 *
 *   Specification<Contact, Person> spec;
 *   spec.rule("name"_fld,     [] (Contact const& c) { return c.first + " " + c.last; })
 *       .rule("greeting"_fld, [] (Contact const&, auto const& self) { return "Hi " + *self("name"_fld); });
 *
 *   auto toPerson = mapping(std::move(spec));
 *   auto person   = toPerson(Contact { "Lando", "Calrissian" });
 *   person("greeting"_fld);  // computes "name" and then "greeting"
 *
 * Besides the typed interface, every record exposes a runtime accessor
 * protocol on Object (has, get, set, remove, keys, describe) that works with
 * type-erased Values and also accepts "expando" fields not declared in the
 * specification.
 */

#pragma once

// Default for Options::detectCycles. Off keeps the unguarded contract where a
// field depending on itself recurses without bound.
#ifndef LAZY_DETECT_CYCLES
 #define LAZY_DETECT_CYCLES 0
#endif

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <format>
#include <functional>
#include <iostream>
#include <iterator>
#include <limits>
#include <memory>
#include <optional>
#include <set>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>
#include <fixed_string.hpp>
#include <CxxUtilities.hpp>
#include "lazy_detail.hpp"
#include "log.hpp"

namespace lazy
{

/**
 * @brief Compile-time string wrapper for use with the "_fld" literal
 *
 * This struct holds a compile-time fixed string and is used as a tag type
 * for accessing record fields by name. Created via the "_fld" user-defined literal.
 *
 * @tparam S The compile-time fixed string representing the field name
 *
 * @see operator""_fld
 */
template <fixstr::fixed_string S>
struct CompileTimeString { static constexpr auto value = S; };

// Forward declarations
template <typename T> class Fundamental;
class Value;
class Invalid;
class Object;

template <typename From, typename To> class Specification;
template <typename From, typename To> class Record;
template <typename From, typename To> class Factory;

//=============================================================================
// Value layer
//=============================================================================

/**
 * @brief Abstract base class for type-erased field values
 *
 * Every value held by a lazy record (computed or assigned) is a Value. It
 * supports:
 *   - Type identification via type()
 *   - Validity checking via isValid() and operator bool()
 *   - Type-safe visitation via visit() with lambda overloads
 *   - Typed access via getIf<T>()
 *
 * Derived classes are:
 *   - Invalid: Sentinel for absent fields
 *   - Fundamental<T>: Concrete wrapper for the supported types
 */
class Value
{
private:
    /// Tuple of all types a record field may hold
    using SupportedFundamentalTypes = std::tuple<
        int8_t, int16_t, int32_t, int64_t,
        float, double,
        bool,
        std::string
    >;

public:
    /// Global singleton representing an absent value
    static Invalid const& kInvalid;

    virtual ~Value() = default;

    /// Returns the std::type_info for the underlying value type
    virtual std::type_info const& type() const = 0;

    /// Returns true if this value is valid (not Invalid)
    virtual bool isValid() const = 0;

    /// Converts to bool based on validity (same as isValid())
    operator bool() const { return isValid(); }

    /// Returns a heap allocated copy of this value
    virtual std::unique_ptr<Value> clone() const = 0;

    /**
     * @brief Assign the value of another Value to the recipient
     *
     * @return Returns true on success and false if the underlying
     * types of other and the recipient do not match.
     */
    virtual bool assign(Value const& other) = 0;

    /**
     * @brief Visit the underlying value with a type-safe lambda
     *
     * The lambda will be called with the underlying value if it supports
     * that type. The lambda can accept any subset of the supported types and
     * Invalid. If the lambda does not accept the held type, nothing is called
     * and a value-initialized result is returned.
     *
     * @code
     * value.visit([](auto const& v) { std::cout << v; });  // Generic visitor
     * value.visit([](int32_t i) { return i * 2; });        // int-only visitor
     * @endcode
     */
    template <typename Lambda>
    auto visit(Lambda && lambda) const -> decltype(auto);

    /// Returns a pointer to the underlying T, or nullptr if this value does not hold a T
    template <typename T>
    T const* getIf() const;

    /// Returns true if T can be held by a Fundamental<T>
    template <typename T>
    static constexpr bool isSupported() { return detail::is_one_of<T, SupportedFundamentalTypes>::value; }

protected:
    template <typename T> friend class Fundamental;

    using ConstTypesVariant = detail::apply_tuple<std::variant,
        decltype(std::tuple_cat(std::declval<std::tuple<std::monostate>>(),
                                std::declval<detail::transform_tuple<SupportedFundamentalTypes, detail::add_const_reference_wrapper>::type>()))>::type;

    virtual ConstTypesVariant visit_helper() const { return {}; }

    Value() = default;
    Value(Value const&) = default;
    Value& operator=(Value const&) = default;
};

/**
 * @brief Sentinel type representing an absent field
 *
 * Invalid is returned when a read finds nothing: the field was never
 * declared or written, or it was deleted. It always returns false for
 * isValid() and can be used in boolean context.
 *
 * @code
 * auto const& fld = record.get("nonexistent");
 * if (! fld) {
 *     std::cout << "Field not found!" << std::endl;
 * }
 * @endcode
 */
class Invalid : public Value
{
public:
    /// Compile-time constant indicating this is not a valid value
    static constexpr auto kIsValid = false;

    Invalid() = default;

    std::type_info const& type() const override { return typeid(void); }
    bool isValid() const override { return false; }
    std::unique_ptr<Value> clone() const override { return std::make_unique<Invalid>(); }
    bool assign(Value const&) override { return false; }
};

/**
 * @brief Concrete wrapper for a value of type T
 *
 * @tparam T The underlying value type, one of the supported fundamental types
 */
template <typename T>
class Fundamental : public Value
{
public:
    static_assert(Value::isSupported<T>(), "Fields may only hold integers, float, double, bool or std::string");

    /// Compile-time constant indicating this is always a valid value
    static constexpr auto kIsValid = true;

    /// Default constructor - creates a Fundamental with value-initialized value
    Fundamental();

    /// Construct from underlying value
    Fundamental(T underlying_);

    /// Returns the type_info for the underlying type T
    std::type_info const& type() const override { return typeid(T); }

    /// Always returns true - Fundamental values are always valid
    bool isValid() const override { return true; }

    /// Always returns true - Fundamental values are always valid (disabled for bool to avoid conflict with operator T())
    constexpr operator bool() const requires (!std::is_same_v<T, bool>) { return true; }

    /// Assign new value
    Fundamental& operator=(T const& newValue);

    /// Returns the underlying value (read-only access)
    T const& operator()() const { return underlying; }

    /// Implicit conversion to the underlying type
    operator T() const { return underlying; }

    /// Set the value
    void set(T newValue);

    // overridden base methods
    std::unique_ptr<Value> clone() const override;
    bool assign(Value const&) override;

protected:
    typename Value::ConstTypesVariant visit_helper() const override;

    T underlying;
};

/**
 * @brief User-defined literal for creating compile-time field name tags
 *
 * The syntax "fieldname"_fld creates a tag that can be passed to
 * Specification::rule and to the typed accessors of Record.
 *
 * @code
 * spec.rule("name"_fld, [] (Contact const& c) { return c.first; });
 * std::optional<std::string> name = record("name"_fld);
 * @endcode
 *
 * @return CompileTimeString containing the field name
 */
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wpedantic"
#ifdef __clang__
#    pragma GCC diagnostic ignored "-Wgnu-string-literal-operator-template"
#endif
template <typename T, T... chars>
constexpr CompileTimeString<fixstr::fixed_string<sizeof...(chars)>({chars...})> operator""_fld();
#pragma GCC diagnostic pop

/**
 * @brief Named field wrapper for use as members of a record shape
 *
 * A shape struct lists the fields of a lazy record, each wrapped in
 * Field<Type, "name">. The shape is never used to store the lazy state;
 * it names the fields, fixes their types and receives the values produced
 * by Record::snapshot(). A Field holds an optional value because a field
 * may be absent (deleted, or without a compute rule).
 *
 * @tparam T The value type, one of the supported fundamental types
 * @tparam Name Compile-time string literal for the field name
 *
 * @code
 * struct Person {
 *     Field<std::string, "name">  name;
 *     Field<int32_t,     "age">   age;
 * };
 * @endcode
 */
template <typename T, fixstr::fixed_string Name>
class Field : public std::optional<T>
{
public:
    using ValueType = T;

    /// Default constructor - creates an empty Field
    Field() = default;

    /// Assign new value to the field
    Field& operator=(T const& t);

    /// Assign new value to the field (move version)
    Field& operator=(T && t);

    /// Returns the compile-time field name as specified in the template parameter
    std::string fieldname() const;
};

//=============================================================================
// Record support types
//=============================================================================

/**
 * @brief Property descriptor returned by Object::describe()
 *
 * Every field of a lazy record is enumerable, writable and configurable.
 * value points at the stored value for materialized fields; it is nullptr
 * for specification fields that have not been computed (describing a field
 * never computes it).
 */
struct Descriptor
{
    bool enumerable   = true;
    bool writable     = true;
    bool configurable = true;
    Value const* value = nullptr;
};

/// Per-factory configuration handed to every record the factory creates
struct Options
{
    /**
     * When true, a field whose computation reads itself (directly or via
     * siblings) throws CircularDependency instead of recursing without bound.
     */
    bool detectCycles = (LAZY_DETECT_CYCLES != 0);
};

/// Thrown by Object::get when Options::detectCycles is set and a field depends on itself
class CircularDependency : public std::logic_error
{
public:
    explicit CircularDependency(std::vector<std::string> chain_);

    /// The fields being computed when the cycle was detected, ending with the repeated field
    std::vector<std::string> const& chain() const noexcept { return fieldChain; }

private:
    static std::string describeChain(std::vector<std::string> const& chain);

    std::vector<std::string> fieldChain;
};

//=============================================================================
// Accessor protocol
//=============================================================================

/**
 * @brief Type-erased base of every lazy record: the accessor protocol
 *
 * Object owns the per-record state (the store of materialized values and the
 * set of tombstoned names) and implements the record-like operations on top
 * of the specification supplied by the derived Record<From, To>:
 *
 *   - has(name):      stored, or declared by the specification
 *   - get(name):      tombstoned -> absent; stored -> stored value;
 *                     declared -> compute, memoize and return; else absent
 *   - set(name, v):   clears the tombstone and stores v
 *   - remove(name):   drops the stored value and tombstones the name
 *   - keys():         specification keys, then expando keys, minus tombstones
 *   - describe(name): descriptor for stored or declared names
 *
 * Reading is const: memoization only touches mutable state. Compute
 * functions receive the record as a const reference, so they can read
 * sibling fields but cannot set or remove them.
 *
 * @note has() ignores tombstones: a deleted specification field still reports
 *       present even though get() returns kInvalid for it. describe() follows
 *       has() in this respect.
 *
 * @note References returned by get() and set() stay valid until the same
 *       name is set or removed again, or the record is destroyed.
 */
class Object
{
public:
    virtual ~Object() = default;

    Object(Object const&) = delete;
    Object& operator=(Object const&) = delete;
    Object(Object&&) = default;
    Object& operator=(Object&&) = default;

    /**
     * @brief Presence test
     *
     * @return true if name is stored or is a specification key (tombstones are not consulted)
     */
    bool has(std::string_view name) const;

    /**
     * @brief Read a field, computing and memoizing it on first access
     *
     * Exceptions thrown by the compute function propagate unchanged and
     * nothing is memoized, so a later read calls the compute function again.
     *
     * @return Reference to the stored value, or kInvalid if the field is absent
     * @throws CircularDependency if cycle detection is enabled and name is already being computed
     */
    Value const& get(std::string_view name) const;

    /// Same as get()
    Value const& operator()(std::string_view name) const { return get(name); }

    /**
     * @brief Write a field, overriding any computed or previously written value
     *
     * Clears a tombstone for name. The name does not need to be declared by
     * the specification ("expando" field).
     *
     * @return Reference to the stored copy of newValue
     */
    Value const& set(std::string_view name, Value const& newValue);

    /// @overload Store a supported fundamental value
    template <typename T>
    Value const& set(std::string_view name, T newValue) requires (Value::isSupported<T>());

    /// @overload Store a C string as std::string
    Value const& set(std::string_view name, char const* newValue);

    /**
     * @brief Delete a field
     *
     * Drops any stored value and tombstones the name so that reads report it
     * absent until it is written again. Deleting an absent field is a no-op.
     *
     * @return Always true
     */
    bool remove(std::string_view name);

    /**
     * @brief Enumerate the field names
     *
     * Specification keys first (in specification order), then names only
     * present in the store (in insertion order), without duplicates and
     * without tombstoned names. Computed afresh on every call.
     */
    std::vector<std::string> keys() const;

    /**
     * @brief Describe a field without computing it
     *
     * @return A descriptor carrying the stored value for stored fields, a
     *         descriptor without value for (possibly tombstoned) specification
     *         keys, and std::nullopt otherwise
     */
    std::optional<Descriptor> describe(std::string_view name) const;

    /// Returns the options this record was created with
    Options const& options() const { return opts; }

protected:
    explicit Object(Options options_);

    /// Names declared by the specification, in specification order
    virtual std::span<std::string const> specificationKeys() const = 0;

    /// Runs the specification's compute function for name
    virtual std::unique_ptr<Value> compute(std::string_view name) const = 0;

private:
    using Entry = std::pair<std::string, std::unique_ptr<Value>>;

    bool isSpecificationKey(std::string_view name) const;
    bool isTombstoned(std::string_view name) const;
    Value const* find(std::string_view name) const;
    Value const& materialize(std::string_view name) const;
    Value const& store(std::string_view name, std::unique_ptr<Value> newValue);
    Value const& memoize(std::string_view name, std::unique_ptr<Value> newValue) const;

    Options opts;
    mutable std::vector<Entry> entries;
    std::set<std::string, std::less<>> tombstones;
    mutable std::vector<std::string> computing;
};

//=============================================================================
// Field specification and records
//=============================================================================

/**
 * @brief Maps the fields of the shape To to compute functions of a From
 *
 * A compute function takes the source value, and optionally the record
 * itself as a read-only execution context so it can read sibling fields:
 *
 * @code
 * spec.rule("name"_fld,  [] (Contact const& c) { return c.first + " " + c.last; });
 * spec.rule("label"_fld, [] (Contact const&, auto const& self) { return *self("name"_fld) + "!"; });
 * @endcode
 *
 * Rules are checked at compile time: the name must be a Field<> of To and the
 * result must convert to that field's type. Defining a rule twice replaces the
 * first one. A field of To without a rule is not part of the specification.
 *
 * @tparam From The source type records are computed from
 * @tparam To   The shape struct of Field<> members
 */
template <typename From, typename To>
class Specification
{
public:
    /// Tuple type of all Field<> types of To, in declaration order
    using FieldsAsTuple = typename detail::fields_of<To>::type;
    static_assert(std::tuple_size_v<FieldsAsTuple> >= 1, "A record shape needs at least one Field<> member");

    /// The value type of the field called FieldName
    template <fixstr::fixed_string FieldName>
    using FieldType = typename detail::field_by_name<FieldName, FieldsAsTuple>::ValueType;

    /// Signature every rule is stored as
    using ComputeFunction = std::function<std::unique_ptr<Value>(From const&, Record<From, To> const&)>;

    /// Compile-time array of all field names of To in declaration order
    static constexpr std::array<std::string_view const, std::tuple_size_v<FieldsAsTuple>> kFieldNames =
        std::invoke([] <typename... Types> (std::type_identity<std::tuple<Types...>>)
        {
            std::array<std::string_view const, std::tuple_size_v<FieldsAsTuple>> returnValue = {{
                detail::field_traits<Types>::kName...
            }};

            return returnValue;
        }, std::type_identity<FieldsAsTuple>());

    Specification() = default;

    /**
     * @brief Define the compute function of a field
     *
     * @param lambda Callable taking (From const&) or (From const&, Record<From, To> const&)
     * @return *this for chaining
     */
    template <fixstr::fixed_string FieldName, typename Lambda>
    Specification& rule(CompileTimeString<FieldName>, Lambda && lambda);

    /// Returns true if a rule is defined for name
    bool contains(std::string_view name) const;

    /// Names with a rule, in the declaration order of To
    std::span<std::string const> keys() const { return names; }

    /// Returns the number of rules
    std::size_t size() const { return names.size(); }

    /**
     * @brief Invoke the rule for name
     *
     * @return The computed value, or nullptr if there is no rule for name
     */
    std::unique_ptr<Value> compute(std::string_view name, From const& source, Record<From, To> const& self) const;

private:
    struct Rule
    {
        std::size_t index;
        ComputeFunction function;
    };

    std::vector<std::string> names;
    std::vector<Rule> rules;
};

/**
 * @brief A lazy record computed from a From according to a Specification<From, To>
 *
 * Record adds the typed interface on top of the accessor protocol of Object:
 *   - Typed reads via operator()(CompileTimeString) using the "_fld" literal
 *   - Typed writes via set(CompileTimeString, value)
 *   - snapshot() materializing the record into a plain To
 *
 * Records are created by a Factory (see mapping()). The record owns a copy of
 * its source and shares the specification with every other record of the
 * same factory.
 */
template <typename From, typename To>
class Record : public Object
{
public:
    using SpecificationType = Specification<From, To>;

    template <fixstr::fixed_string FieldName>
    using FieldType = typename SpecificationType::template FieldType<FieldName>;

    Record(std::shared_ptr<SpecificationType const> specification_, From source_, Options options_ = {});

    using Object::operator();
    using Object::set;

    /**
     * @brief Typed read of a field using the "_fld" literal
     *
     * @return The value, or an empty optional if the field is absent or
     *         currently holds a value of another type
     */
    template <fixstr::fixed_string FieldName>
    std::optional<FieldType<FieldName>> operator()(CompileTimeString<FieldName>) const
    {
        if (auto const* typed = get(std::string_view(FieldName)).template getIf<FieldType<FieldName>>())
            return *typed;

        return std::nullopt;
    }

    /// Typed write of a field using the "_fld" literal
    template <fixstr::fixed_string FieldName>
    Value const& set(CompileTimeString<FieldName>, FieldType<FieldName> newValue)
    {
        return Object::set(std::string_view(FieldName), std::move(newValue));
    }

    /**
     * @brief Materialize the record into a plain To
     *
     * Reads every field of To through the same lazy path as get(). Absent
     * fields (tombstoned, or without a rule and never written) stay empty.
     */
    To snapshot() const;

    /// Returns the source value the record computes from
    From const& source() const { return src; }

    /// Returns the specification shared by all records of the same factory
    SpecificationType const& specification() const { return *spec; }

protected:
    std::span<std::string const> specificationKeys() const override { return spec->keys(); }
    std::unique_ptr<Value> compute(std::string_view name) const override;

private:
    std::shared_ptr<SpecificationType const> spec;
    From src;
};

/**
 * @brief Creates lazy records from source values
 *
 * Obtained from mapping(). Creating the factory or a record never calls a
 * compute function.
 */
template <typename From, typename To>
class Factory
{
public:
    Factory(std::shared_ptr<Specification<From, To> const> specification_, Options options_);

    /// Creates a new, empty record bound to source
    Record<From, To> operator()(From source) const;

    /// Returns the shared specification
    Specification<From, To> const& specification() const { return *spec; }

    /// Returns the options handed to every record
    Options const& options() const { return opts; }

private:
    std::shared_ptr<Specification<From, To> const> spec;
    Options opts;
};

/**
 * @brief Turns a specification into a factory of lazy records
 *
 * @code
 * auto toPerson = mapping(std::move(spec));
 * auto person   = toPerson(contact);
 * @endcode
 */
template <typename From, typename To>
Factory<From, To> mapping(Specification<From, To> specification, Options options = {});

// Stream output operators
std::ostream& operator<<(std::ostream& o, lazy::Value const& x);
std::ostream& operator<<(std::ostream& o, lazy::Object const& x);
std::ostream& operator<<(std::ostream& o, lazy::Invalid const& x);
} // namespace lazy

// std::formatter specializations
template <>
struct std::formatter<lazy::Object> : std::formatter<std::string>
{
    auto format(lazy::Object const& v, format_context& ctx) const;
};

template <typename From, typename To>
struct std::formatter<lazy::Record<From, To>> : std::formatter<lazy::Object> {};

template<typename CharT>
struct std::formatter<lazy::Invalid, CharT>
{
    template<class ParseContext>
    constexpr ParseContext::iterator parse(ParseContext& ctx) { return ctx.begin(); }

    template<class FmtContext>
    FmtContext::iterator format(lazy::Invalid const&, FmtContext& ctx) const { return ctx.out(); }
};

template<typename CharT>
struct std::formatter<lazy::Value, CharT>
{
    template<class ParseContext>
    constexpr ParseContext::iterator parse(ParseContext& ctx) { return ctx.begin(); }

    template<class FmtContext>
    FmtContext::iterator format(lazy::Value const& v, FmtContext& ctx) const;
};

template <typename T, typename CharT>
struct std::formatter<lazy::Fundamental<T>, CharT> : std::formatter<lazy::Value, CharT> {};

// Include template implementations
#include "lazy.tpp"
