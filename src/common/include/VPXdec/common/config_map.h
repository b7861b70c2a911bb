/* Copyright (c) V-Nova International Limited 2025-2026. All rights reserved.
 * This software is licensed under the BSD-3-Clause-Clear License by V-Nova Limited.
 * No patent licenses are granted under this license. For enquiries about patent licenses,
 * please contact legal@v-nova.com.
 * The VPXdec software is a stand-alone project and is NOT A CONTRIBUTION to any other project.
 * If the software is incorporated into another project, THE TERMS OF THE BSD-3-CLAUSE-CLEAR LICENSE
 * AND THE ADDITIONAL LICENSING INFORMATION CONTAINED IN THIS FILE MUST BE MAINTAINED, AND THE
 * SOFTWARE DOES NOT AND MUST NOT ADOPT THE LICENSE OF THE INCORPORATING PROJECT. However, the
 * software may be incorporated into a project under a compatible license provided the requirements
 * of the BSD-3-Clause-Clear license are respected, and V-Nova Limited remains
 * licensor of the software ONLY UNDER the BSD-3-Clause-Clear license (not the compatible license).
 * ANY ONWARD DISTRIBUTION, WHETHER STAND-ALONE OR AS PART OF ANY OTHER PROJECT, REMAINS SUBJECT TO
 * THE EXCLUSION OF PATENT LICENSES PROVISION OF THE BSD-3-CLAUSE-CLEAR LICENSE. */

#ifndef VD_VPXDEC_COMMON_CONFIG_MAP_H
#define VD_VPXDEC_COMMON_CONFIG_MAP_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace vpxdec {

// - ConfigBinding --------------------------------------------------------------------------------

// Every binding derives from this, so that a config class can dispatch a named value without
// knowing which member it lands in. C is the configuration object whose members are set. A
// binding only overrides the setter for its own member type; the others report failure.
//
template <typename C>
struct ConfigBindingBase
{
    virtual ~ConfigBindingBase() = default;
    virtual bool set(C& /*cfg*/, const bool& /*val*/) const { return false; }
    virtual bool set(C& /*cfg*/, const int32_t& /*val*/) const { return false; }
    virtual bool set(C& /*cfg*/, const std::string& /*val*/) const { return false; }
};

// Binding for a scalar member.
//
template <typename C, typename T>
struct ConfigBinding : public ConfigBindingBase<C>
{
    using ConfigBindingBase<C>::set;

    explicit ConfigBinding(T C::*ptr)
        : memberPointer(ptr)
    {}

    bool set(C& cfg, const T& val) const override
    {
        cfg.*memberPointer = val;
        return true;
    }

    T C::*memberPointer;
};

template <typename C, typename T>
std::unique_ptr<const ConfigBindingBase<C>> makeBinding(T C::*ptr)
{
    return std::make_unique<ConfigBinding<C, T>>(ptr);
}

// Binding for one element of an array member, e.g. a per-component log level.
//
template <typename C, typename T, size_t N>
struct ConfigBindingArrElement : public ConfigBindingBase<C>
{
    using ConfigBindingBase<C>::set;

    ConfigBindingArrElement(std::array<T, N> C::*ptr, size_t offset)
        : memberPointer(ptr)
        , index(offset)
    {}

    bool set(C& cfg, const T& val) const override
    {
        (cfg.*memberPointer)[index] = val;
        return true;
    }

    std::array<T, N> C::*memberPointer;
    size_t index;
};

template <typename C, typename T, size_t N>
std::unique_ptr<const ConfigBindingBase<C>> makeBindingArrElement(std::array<T, N> C::*ptr,
                                                                  size_t offset)
{
    return std::make_unique<ConfigBindingArrElement<C, T, N>>(ptr, offset);
}

// - ConfigMap ------------------------------------------------------------------------------------

// Name to binding lookup. Unknown names resolve to a binding that rejects every value.
//
template <typename C>
class ConfigMap
{
public:
    using BindingPtr = std::unique_ptr<const ConfigBindingBase<C>>;

    ConfigMap() = default;

    void add(std::string name, BindingPtr binding)
    {
        m_bindings[std::move(name)] = std::move(binding);
    }

    const ConfigBindingBase<C>& getConfig(std::string_view name) const
    {
        static const ConfigBindingBase<C> kRejectAll{};
        auto iter = m_bindings.find(std::string(name));
        if (iter == m_bindings.end()) {
            return kRejectAll;
        }
        return *iter->second;
    }

    bool contains(std::string_view name) const
    {
        return m_bindings.count(std::string(name)) != 0;
    }

    size_t size() const { return m_bindings.size(); }

private:
    std::unordered_map<std::string, BindingPtr> m_bindings;
};

} // namespace vpxdec

#endif // VD_VPXDEC_COMMON_CONFIG_MAP_H
