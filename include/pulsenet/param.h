#pragma once

/**
 * @file param.h
 * @brief Parameter wrapper for tunable pipeline settings
 *
 * Param<T> combines a value with its metadata (name, range, default) so the
 * tuning surface can be introspected and driven by name from a UI or a
 * config file without each component hand-writing its own plumbing.
 */

#include <cmath>
#include <string>
#include <type_traits>

namespace pulsenet {

/**
 * @brief Parameter data types
 */
enum class ParamType {
    Float,
    Int,
    Bool
};

/**
 * @brief Parameter declaration for introspection
 */
struct ParamDecl {
    std::string name;           ///< Parameter name
    ParamType type;             ///< Data type
    float minVal = 0.0f;        ///< Minimum value
    float maxVal = 1.0f;        ///< Maximum value
    float defaultVal = 0.0f;    ///< Default value
};

/**
 * @brief Type traits mapping C++ types to ParamType enum
 * @tparam T C++ type
 */
template<typename T> struct ParamTypeFor;
template<> struct ParamTypeFor<float> { static constexpr ParamType value = ParamType::Float; };
template<> struct ParamTypeFor<int>   { static constexpr ParamType value = ParamType::Int; };
template<> struct ParamTypeFor<bool>  { static constexpr ParamType value = ParamType::Bool; };

/**
 * @brief Scalar parameter wrapper (float, int, bool)
 * @tparam T Value type (float, int, or bool)
 *
 * Supports implicit conversion so it can be used like a regular value.
 *
 * @par Example
 * @code
 * class BeatDetector : public ParamRegistry {
 *     Param<float> sensitivity{"sensitivity", 0.6f, 0.3f, 1.0f};
 *
 *     BeatDetector() { registerParam(sensitivity); }
 * };
 * @endcode
 */
template<typename T>
class Param {
public:
    /**
     * @brief Construct a parameter
     * @param name Name used for lookup and display
     * @param defaultVal Default value
     * @param minVal Minimum allowed value
     * @param maxVal Maximum allowed value
     */
    Param(const char* name, T defaultVal, T minVal = T{}, T maxVal = T{1})
        : m_name(name), m_value(defaultVal), m_default(defaultVal), m_min(minVal), m_max(maxVal) {}

    /// @brief Implicit conversion to value type
    operator T() const { return m_value; }

    /// @brief Get value explicitly
    T get() const { return m_value; }

    /// @brief Assignment operator (no range check, use clamped() for that)
    Param& operator=(T v) {
        m_value = v;
        return *this;
    }

    /// @brief Clamp a candidate value into this parameter's range (NaN gives the default)
    T clamped(T v) const {
        if constexpr (std::is_floating_point_v<T>) {
            if (std::isnan(v)) return m_default;
        }
        if (v < m_min) return m_min;
        if (v > m_max) return m_max;
        return v;
    }

    /// @brief Restore the default value
    void reset() { m_value = m_default; }

    /// @brief Get parameter name
    const char* name() const { return m_name; }

    /// @brief Get minimum value
    T min() const { return m_min; }

    /// @brief Get maximum value
    T max() const { return m_max; }

    /// @brief Get default value
    T defaultValue() const { return m_default; }

    /**
     * @brief Generate ParamDecl for introspection
     */
    ParamDecl decl() const {
        return {m_name, ParamTypeFor<T>::value,
                static_cast<float>(m_min), static_cast<float>(m_max),
                static_cast<float>(m_default)};
    }

private:
    const char* m_name;
    T m_value;
    T m_default;
    T m_min, m_max;
};

} // namespace pulsenet
