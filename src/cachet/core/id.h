#ifndef CACHET_CORE_ID_H
#define CACHET_CORE_ID_H

#include <memory>
#include <ostream>
#include <sstream>
#include <type_traits>
#include <typeinfo>
#include <utility>

#include <cachet/core/hash.h>
#include <cachet/core/type_definitions.h>

// This file defines the type-erased identifiers that are used as cache keys.
//
// An ID is an immutable value that can be compared for equality with any
// other ID and hashed. IDs of different underlying types are never equal.
// Code that needs to hold onto an ID beyond the scope of a call should
// capture it (see captured_id below).

namespace cachet {

struct id_interface
{
    virtual ~id_interface()
    {
    }

    // Create a standalone copy of the ID.
    virtual id_interface*
    clone() const = 0;

    // Given another ID of the same type, return true iff it's equal to this
    // one. IDs of other types are never equal.
    virtual bool
    equals(id_interface const& other) const = 0;

    // Write a textual representation of the ID to a stream.
    virtual void
    stream(std::ostream& o) const = 0;

    virtual size_t
    hash() const = 0;
};

inline bool
operator==(id_interface const& a, id_interface const& b)
{
    return a.equals(b);
}
inline bool
operator!=(id_interface const& a, id_interface const& b)
{
    return !(a == b);
}

inline std::ostream&
operator<<(std::ostream& o, id_interface const& id)
{
    id.stream(o);
    return o;
}

inline size_t
hash_value(id_interface const& id)
{
    return id.hash();
}

// Get the textual representation of an ID (for diagnostics).
inline string
to_string(id_interface const& id)
{
    std::ostringstream stream;
    stream << id;
    return stream.str();
}

// The following are for storing ID pointers in unordered containers (while
// the IDs themselves are owned elsewhere).

struct id_interface_pointer_hash
{
    size_t
    operator()(id_interface const* id) const
    {
        return id->hash();
    }
};

struct id_interface_pointer_equality_test
{
    bool
    operator()(id_interface const* a, id_interface const* b) const
    {
        return *a == *b;
    }
};

namespace detail {

template<class T, class = void>
struct is_streamable : std::false_type
{
};

template<class T>
struct is_streamable<
    T,
    std::void_t<decltype(
        std::declval<std::ostream&>() << std::declval<T const&>())>>
    : std::true_type
{
};

} // namespace detail

// simple_id<Value> is the standard ID implementation. :Value must support ==
// and must be hashable by boost::hash (i.e., via std types or an overload of
// hash_value). Values that can be streamed are shown as themselves in
// diagnostics. Others are shown by type name and hash.
template<class Value>
struct simple_id : id_interface
{
    simple_id()
    {
    }

    simple_id(Value value) : value_(std::move(value))
    {
    }

    Value const&
    value() const
    {
        return value_;
    }

    id_interface*
    clone() const override
    {
        return new simple_id(value_);
    }

    bool
    equals(id_interface const& other) const override
    {
        simple_id const* other_id = dynamic_cast<simple_id const*>(&other);
        return other_id && value_ == other_id->value_;
    }

    void
    stream(std::ostream& o) const override
    {
        if constexpr (detail::is_streamable<Value>::value)
            o << value_;
        else
            o << typeid(Value).name() << "#" << invoke_hash(value_);
    }

    size_t
    hash() const override
    {
        return invoke_hash(value_);
    }

 private:
    Value value_;
};

template<class Value>
simple_id<Value>
make_id(Value value)
{
    return simple_id<Value>(std::move(value));
}

// String literals are captured by value rather than by pointer.
inline simple_id<string>
make_id(char const* value)
{
    return simple_id<string>(string(value));
}

// captured_id holds its own copy of an ID. It's copyable and movable, and
// copying it clones the underlying ID.
struct captured_id
{
    captured_id()
    {
    }

    explicit captured_id(id_interface const& id) : id_(id.clone())
    {
    }

    captured_id(captured_id const& other)
        : id_(other.id_ ? other.id_->clone() : nullptr)
    {
    }

    captured_id(captured_id&& other) = default;

    captured_id&
    operator=(captured_id const& other)
    {
        id_.reset(other.id_ ? other.id_->clone() : nullptr);
        return *this;
    }

    captured_id&
    operator=(captured_id&& other) = default;

    void
    capture(id_interface const& id)
    {
        id_.reset(id.clone());
    }

    bool
    is_initialized() const
    {
        return id_ ? true : false;
    }

    // Everything below here should only be called if the ID is initialized.

    id_interface const&
    get() const
    {
        return *id_;
    }

    id_interface const&
    operator*() const
    {
        return *id_;
    }

    id_interface const*
    operator->() const
    {
        return id_.get();
    }

 private:
    std::unique_ptr<id_interface> id_;
};

// Two uninitialized captured_ids are equal. An uninitialized one is never
// equal to an initialized one.
inline bool
operator==(captured_id const& a, captured_id const& b)
{
    return a.is_initialized()
               ? b.is_initialized() && a.get() == b.get()
               : !b.is_initialized();
}
inline bool
operator!=(captured_id const& a, captured_id const& b)
{
    return !(a == b);
}

inline std::ostream&
operator<<(std::ostream& o, captured_id const& id)
{
    if (id.is_initialized())
        o << id.get();
    else
        o << "<null id>";
    return o;
}

inline size_t
hash_value(captured_id const& id)
{
    return id.is_initialized() ? id.get().hash() : 0;
}

} // namespace cachet

#endif
