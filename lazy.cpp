#include "lazy.hpp"

namespace lazy
{
std::atomic<LogLevel> gLogLevel { LogLevel::off };

//=============================================================================
// Value implementations
//=============================================================================

// Initialize the global invalid value singleton
Invalid const& Value::kInvalid = std::invoke([] () -> Invalid const&
{
    static Invalid const invld;
    return invld;
});

//=============================================================================
// CircularDependency implementations
//=============================================================================

CircularDependency::CircularDependency(std::vector<std::string> chain_)
    : std::logic_error(describeChain(chain_)), fieldChain(std::move(chain_))
{}

std::string CircularDependency::describeChain(std::vector<std::string> const& chain)
{
    std::ostringstream ss;
    ss << "circular field dependency: ";
    std::copy(chain.begin(), chain.end(), std::ostream_iterator<std::string>(ss, " -> "));
    return ss.str().substr(0, ss.str().size() - 4);
}

//=============================================================================
// Object implementations
//=============================================================================

Object::Object(Options options_) : opts(options_) {}

bool Object::has(std::string_view name) const
{
    return find(name) != nullptr || isSpecificationKey(name);
}

Value const& Object::get(std::string_view name) const
{
    if (isTombstoned(name))
        return Value::kInvalid;

    if (auto const* stored = find(name))
        return *stored;

    if (! isSpecificationKey(name))
        return Value::kInvalid;

    return materialize(name);
}

Value const& Object::set(std::string_view name, Value const& newValue)
{
    return store(name, newValue.clone());
}

Value const& Object::set(std::string_view name, char const* newValue)
{
    return set(name, std::string(newValue));
}

bool Object::remove(std::string_view name)
{
    entries.erase(std::remove_if(entries.begin(), entries.end(), [name] (Entry const& e) { return e.first == name; }), entries.end());
    tombstones.emplace(name);

    LAZY_LOG_DEBUG("lazy", "tombstoned field '%.*s'", static_cast<int>(name.size()), name.data());
    return true;
}

std::vector<std::string> Object::keys() const
{
    std::vector<std::string> result;

    auto include = [this, &result] (std::string const& name)
    {
        if (isTombstoned(name))
            return;

        if (std::find(result.begin(), result.end(), name) == result.end())
            result.push_back(name);
    };

    for (auto const& name : specificationKeys())
        include(name);

    for (auto const& entry : entries)
        include(entry.first);

    return result;
}

std::optional<Descriptor> Object::describe(std::string_view name) const
{
    if (auto const* stored = find(name))
        return Descriptor { .value = stored };

    if (isSpecificationKey(name))
        return Descriptor {};

    return std::nullopt;
}

bool Object::isSpecificationKey(std::string_view name) const
{
    auto const keys = specificationKeys();
    return std::find(keys.begin(), keys.end(), name) != keys.end();
}

bool Object::isTombstoned(std::string_view name) const
{
    return tombstones.find(name) != tombstones.end();
}

Value const* Object::find(std::string_view name) const
{
    auto it = std::find_if(entries.begin(), entries.end(), [name] (Entry const& e) { return e.first == name; });
    return it != entries.end() ? it->second.get() : nullptr;
}

Value const& Object::materialize(std::string_view name) const
{
    if (opts.detectCycles && std::find(computing.begin(), computing.end(), name) != computing.end())
    {
        auto chain = computing;
        chain.emplace_back(name);

        CircularDependency error(std::move(chain));
        LAZY_LOG_ERROR("lazy", "%s", error.what());
        throw error;
    }

    computing.emplace_back(name);
    auto raiiPop = cxxutils::callAtEndOfScope(std::false_type(),
                                              [this] (std::false_type)
                                              {
                                                  computing.pop_back();
                                              });

    LAZY_LOG_DEBUG("lazy", "computing field '%.*s'", static_cast<int>(name.size()), name.data());

    auto computed = compute(name);

    // the compute function has no rule for this name after all
    if (computed == nullptr)
        return Value::kInvalid;

    return memoize(name, std::move(computed));
}

Value const& Object::store(std::string_view name, std::unique_ptr<Value> newValue)
{
    if (auto it = tombstones.find(name); it != tombstones.end())
        tombstones.erase(it);

    return memoize(name, std::move(newValue));
}

Value const& Object::memoize(std::string_view name, std::unique_ptr<Value> newValue) const
{
    auto it = std::find_if(entries.begin(), entries.end(), [name] (Entry const& e) { return e.first == name; });

    if (it != entries.end())
    {
        it->second = std::move(newValue);
        return *it->second;
    }

    entries.emplace_back(std::string(name), std::move(newValue));
    return *entries.back().second;
}
} // namespace lazy
