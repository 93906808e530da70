#pragma once

/**
 * @file param_registry.h
 * @brief Name-based access to a component's Param<T> members
 *
 * Components register their Param<T> members once in the constructor and
 * get params()/getParam()/setParam() for free. Values written through
 * setParam() are clamped to the declared range.
 */

#include <pulsenet/param.h>
#include <algorithm>
#include <cmath>
#include <functional>
#include <string>
#include <vector>

namespace pulsenet {

class ParamRegistry {
public:
    ParamRegistry() = default;
    virtual ~ParamRegistry() = default;

    // Entries hold references to the owning object's members
    ParamRegistry(const ParamRegistry&) = delete;
    ParamRegistry& operator=(const ParamRegistry&) = delete;

    /// @brief Declarations of every registered parameter, in registration order
    std::vector<ParamDecl> params() const { return registeredParams(); }

    /**
     * @brief Read a parameter by name
     * @param name Parameter name
     * @param out Receives the value in out[0]
     * @return false if no such parameter
     */
    bool getParam(const std::string& name, float out[4]) const {
        return getRegisteredParam(name, out);
    }

    /**
     * @brief Write a parameter by name
     * @param name Parameter name
     * @param value New value in value[0], clamped to the parameter range
     * @return false if no such parameter
     */
    bool setParam(const std::string& name, const float value[4]) {
        return setRegisteredParam(name, value);
    }

protected:
    template<typename T>
    void registerParam(Param<T>& param) {
        Entry e;
        e.decl = param.decl();
        e.get = [&param]() { return static_cast<float>(param.get()); };
        e.set = [&param](float v) {
            // Range-limit in float first so the cast to T is always defined
            if (std::isnan(v)) {
                param.reset();
                return;
            }
            v = std::clamp(v, static_cast<float>(param.min()), static_cast<float>(param.max()));
            param = param.clamped(static_cast<T>(v));
        };
        m_entries.push_back(std::move(e));
    }

    std::vector<ParamDecl> registeredParams() const {
        std::vector<ParamDecl> decls;
        decls.reserve(m_entries.size());
        for (const auto& e : m_entries) {
            decls.push_back(e.decl);
        }
        return decls;
    }

    bool getRegisteredParam(const std::string& name, float out[4]) const {
        for (const auto& e : m_entries) {
            if (e.decl.name == name) {
                out[0] = e.get();
                return true;
            }
        }
        return false;
    }

    bool setRegisteredParam(const std::string& name, const float value[4]) {
        for (auto& e : m_entries) {
            if (e.decl.name == name) {
                e.set(value[0]);
                return true;
            }
        }
        return false;
    }

private:
    struct Entry {
        ParamDecl decl;
        std::function<float()> get;
        std::function<void(float)> set;
    };

    std::vector<Entry> m_entries;
};

} // namespace pulsenet
