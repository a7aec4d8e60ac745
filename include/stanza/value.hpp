#pragma once


/*
    -------------------------------------
    Stanza::value - Parsed JSON tree node
    -------------------------------------
    The `Stanza::value` type represents any JSON value:
        - null
        - boolean
        - number (kept as the literal text from the input)
        - string
        - array
        - object
    It is the node type of the tree built by `Stanza::Deserializer`

    -------
    Numbers
    -------
    - Numbers are never coerced to `double` or an integer type. The literal
      text found in the input (e.g. `-100.001e10`) is stored verbatim in a
      `Stanza::number`, preserving precision and formatting. Callers convert
      the text themselves (e.g. with `std::from_chars`) when they need to

    -----------------
    Memory Management
    -----------------
    - `value` is allocator-aware and uses `std::pmr::memory_resource` for all
      internal allocations (strings, numbers, arrays, objects)
    - Copy construction/assignment:
        * The destination `value` adopts the allocator of the source and performs
          a deep copy of the underlying JSON tree into that allocator
    - Move construction/assignment:
        * The destination `value` steals the allocator and storage of the source
    - Every nested value is owned by its parent container; trees never share
      nodes and cannot contain cycles

    ------
    Access
    ------
    - A tree is not modified after construction, so only read access is
      offered:
        * `type()` and the `is_*()` predicates
        * `as_bool()`, `as_number()`, `as_string()`, `as_array()`, `as_object()`
          which assume the kind matches (checked by `std::get`)
        * `operator[](size_t)`, `find(key)`, `at(key)` for navigation
    - Objects are keyed maps; duplicate keys in the input keep the last
      value, and key order of the input is not retained

    -------------
    Thread-Safety
    -------------
    - It is safe to use separate `value` instances from multiple threads
    - Concurrent reads of the same `value` are safe as long as nobody
      assigns to it
*/

/// @defgroup Stanza Stanza JSON Library
/// @brief Core types and functions for Stanza

/// @defgroup StanzaValue Value Tree
/// @ingroup Stanza

#include <variant>
#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <memory_resource>
#include <cstddef>
#include <cstdint>
#include <utility>
#include "stanza/config.hpp"

namespace Stanza {
    /// @brief Enumerates the possible JSON value kinds held by Stanza::value
    enum class kind : uint8_t {
        null, ///< JSON null value
        boolean, ///< JSON boolean value (`true` or `false`)
        number, ///< JSON number value (stored as literal text)
        string, ///< JSON string value
        array, ///< JSON array value
        object, ///< JSON object value
    };


    template<class T>
    using pmr_vector = std::pmr::vector<T>;

    template<class Key, class T, class Compare = std::less<>>
    using pmr_map = std::pmr::map<Key, T, Compare>;

    /// @ingroup StanzaValue
    /// @brief String type used by Stanza::value and tokens (allocator-aware)
    using string = std::pmr::string;

    struct value;
    using allocator_type = std::pmr::polymorphic_allocator<value>;

    /// @ingroup StanzaValue
    /// @brief A JSON number held as its literal text
    ///
    /// @details
    /// `text` always satisfies the JSON number grammar when produced by the
    /// tokenizer: optional `-`, `0` or a digit run without leading zero,
    /// optional `.` and digits, optional `e`/`E`, sign and digits.
    struct number {
        string text;

        friend bool operator==(const number& lhs, const number& rhs) = default;
    };

    /// @ingroup StanzaValue
    /// @brief Array type used by Stanza::value (JSON arrays)
    using array = pmr_vector<value>;

    /// @ingroup StanzaValue
    /// @brief Object type used by Stanza::value (JSON objects)
    using object = pmr_map<string, value>;

    /// @ingroup StanzaValue
    /// @brief Variant storage used internally by Stanza::value
    /// @details Exposed only for completeness; most users interact via
    ///          Stanza::value member functions instead of using this alias
    using storage_t = std::variant<
        std::monostate,
        bool,
        number,
        string,
        array,
        object
    >;


    /// @ingroup StanzaValue
    /// @brief Node of a parsed JSON tree.
    ///
    /// @details
    /// All nested allocations (strings, numbers, arrays, objects) are performed
    /// using the `std::pmr::memory_resource` associated with each `value`.
    struct value {
        // ------------------------------------------------------------
        // Constructors / assignment / destructor
        // ------------------------------------------------------------

        /// @ingroup StanzaValue
        /// @brief Constructs a null JSON value using the given memory resource
        STANZA_API explicit value(std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @ingroup StanzaValue
        /// @brief Constructs a null JSON value; exists to make `value{ nullptr }`
        ///        read as an explicit null
        STANZA_API value(std::nullptr_t, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @ingroup StanzaValue
        /// @brief Constructs a boolean JSON value
        STANZA_API value(bool b, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @ingroup StanzaValue
        /// @brief Constructs a number JSON value from its literal text
        ///
        /// @param n Number literal to store. May be moved from
        /// @param res Memory resource used for nested allocations
        STANZA_API value(number n, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @ingroup StanzaValue
        /// @brief Constructs a string JSON value from a C string
        STANZA_API value(const char* s, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @ingroup StanzaValue
        /// @brief Constructs a string JSON value from a string_view
        ///
        /// @param sv UTF-8 string view; characters are copied into an
        ///           allocator-backed `Stanza::string`
        /// @param res Memory resource used for string storage
        STANZA_API value(std::string_view sv, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @ingroup StanzaValue
        /// @brief Constructs a string JSON value from an existing Stanza::string
        STANZA_API value(string s, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @ingroup StanzaValue
        /// @brief Constructs an array JSON value from an existing array
        STANZA_API value(array a, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @ingroup StanzaValue
        /// @brief Constructs an object JSON value from an existing object
        STANZA_API value(object o, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @ingroup StanzaValue
        /// @brief Copy-constructs a JSON value
        ///
        /// @details
        /// The new value adopts the allocator of @p other. The entire JSON
        /// tree rooted at @p other is deeply copied into the new value using
        /// that allocator
        STANZA_API value(const value& other);

        /// @ingroup StanzaValue
        /// @brief Move-constructs a JSON value
        ///
        /// @details
        /// The new value steals the allocator and storage from @p other.
        /// After the move, @p other is left in a valid but unspecified state
        STANZA_API value(value&& other) noexcept;

        /// @ingroup StanzaValue
        /// @brief Copy-assigns a JSON value (deep copy)
        STANZA_API value& operator=(const value& other);

        /// @ingroup StanzaValue
        /// @brief Move-assigns a JSON value
        STANZA_API value& operator=(value&& other) noexcept;

        // ------------------------------------------------------------
        // Introspection
        // ------------------------------------------------------------

        /// @ingroup StanzaValue
        /// @brief Returns the kind of JSON value currently stored.
        [[nodiscard]] STANZA_API kind type() const noexcept;

        [[nodiscard]] bool is_null()   const noexcept { return type() == kind::null;    }
        [[nodiscard]] bool is_bool()   const noexcept { return type() == kind::boolean; }
        [[nodiscard]] bool is_number() const noexcept { return type() == kind::number;  }
        [[nodiscard]] bool is_string() const noexcept { return type() == kind::string;  }
        [[nodiscard]] bool is_array()  const noexcept { return type() == kind::array;   }
        [[nodiscard]] bool is_object() const noexcept { return type() == kind::object;  }

        // ------------------------------------------------------------
        // Accessors
        // ------------------------------------------------------------

        /// @ingroup StanzaValue
        /// @brief Returns the stored boolean
        /// @throws std::bad_variant_access if `is_bool()` is false
        [[nodiscard]] STANZA_API bool as_bool() const;

        /// @ingroup StanzaValue
        /// @brief Returns the literal text of the stored number
        /// @throws std::bad_variant_access if `is_number()` is false
        [[nodiscard]] STANZA_API const string& as_number() const;

        /// @ingroup StanzaValue
        /// @brief Returns the stored string
        /// @throws std::bad_variant_access if `is_string()` is false
        [[nodiscard]] STANZA_API const string& as_string() const;

        /// @ingroup StanzaValue
        /// @brief Returns the stored array
        /// @throws std::bad_variant_access if `is_array()` is false
        [[nodiscard]] STANZA_API const array& as_array() const;

        /// @ingroup StanzaValue
        /// @brief Returns the stored object
        /// @throws std::bad_variant_access if `is_object()` is false
        [[nodiscard]] STANZA_API const object& as_object() const;

        /// @ingroup StanzaValue
        /// @brief Returns the size of the array or object
        /// @details
        /// For arrays, this is the number of elements
        /// For objects, this is the number of key/value pairs
        /// For non-container types, returns 0
        [[nodiscard]] STANZA_API size_t size() const noexcept;

        // ------------------------------------------------------------
        // Navigation
        // ------------------------------------------------------------

        /// @ingroup StanzaValue
        /// @brief Accesses an array element by index
        ///
        /// @details
        /// If the value is not an array or @p idx is out of range, a
        /// reference to a shared null value is returned
        STANZA_API const value& operator[](size_t idx) const;

        /// @ingroup StanzaValue
        /// @brief Finds a member with the given key in the object
        ///
        /// @return Pointer to the value mapped to @p key, or nullptr if the
        ///         value is not an object or the key is missing
        STANZA_API const value* find(std::string_view key) const;

        /// @ingroup StanzaValue
        /// @brief Returns a const reference to the value associated with @p key
        /// @throws std::out_of_range If the key does not exist or the value is not an object
        STANZA_API const value& at(std::string_view key) const;

        /// @ingroup StanzaValue
        /// @brief Structural equality
        ///
        /// @details
        /// Two values are equal if they have the same kind and equal contents.
        /// Numbers compare by literal text, so `1.0` and `1` are different.
        STANZA_API friend bool operator==(const value& lhs, const value& rhs);

        /// @ingroup StanzaValue
        /// @brief Returns the memory resource associated with this value
        [[nodiscard]] STANZA_API std::pmr::memory_resource* resource() const noexcept { return m_MemRes; }

        /// @ingroup StanzaValue
        /// @brief Returns a const reference to the underlying variant storage
        [[nodiscard]] STANZA_API const storage_t& storage() const noexcept { return m_Storage; }


    private:
        std::pmr::memory_resource* m_MemRes{};
        storage_t m_Storage{};

        static storage_t clone_storage(const storage_t& s, std::pmr::memory_resource* res);
    };

} // namespace Stanza
