// include/bus/bluez_dbus_util.hpp
#pragma once
#include "bus/idevice_bus.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include <systemd/sd-bus.h>

namespace bus
{

// Reads one variant into out. Returns 1 if decoded, 0 if the payload type is not one we
// keep (the variant is skipped), <0 on error.
[[maybe_unused]] static inline int read_variant_value(sd_bus_message *m, PropertyValue &out)
{
    char        type     = 0;
    const char *contents = nullptr;
    int         r        = sd_bus_message_peek_type(m, &type, &contents);
    if (r < 0)
        return r;
    if (type != SD_BUS_TYPE_VARIANT || !contents)
        return -EINVAL;

    // only single basic types
    if (std::strlen(contents) != 1 || !std::strchr("bsoynqiuxt", contents[0]))
    {
        r = sd_bus_message_skip(m, "v");
        return r < 0 ? r : 0;
    }

    r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, contents);
    if (r < 0)
        return r;

    switch (contents[0])
    {
        case 'b':
        {
            int b = 0;
            r     = sd_bus_message_read_basic(m, 'b', &b);
            out   = (b != 0);
            break;
        }
        case 's':
        case 'o':
        {
            const char *s = nullptr;
            r             = sd_bus_message_read_basic(m, contents[0], &s);
            out           = std::string(s ? s : "");
            break;
        }
        case 'y':
        {
            uint8_t v = 0;
            r         = sd_bus_message_read_basic(m, 'y', &v);
            out       = (std::int64_t)v;
            break;
        }
        case 'n':
        {
            int16_t v = 0;
            r         = sd_bus_message_read_basic(m, 'n', &v);
            out       = (std::int64_t)v;
            break;
        }
        case 'q':
        {
            uint16_t v = 0;
            r          = sd_bus_message_read_basic(m, 'q', &v);
            out        = (std::int64_t)v;
            break;
        }
        case 'i':
        {
            int32_t v = 0;
            r         = sd_bus_message_read_basic(m, 'i', &v);
            out       = (std::int64_t)v;
            break;
        }
        case 'u':
        {
            uint32_t v = 0;
            r          = sd_bus_message_read_basic(m, 'u', &v);
            out        = (std::int64_t)v;
            break;
        }
        case 'x':
        {
            int64_t v = 0;
            r         = sd_bus_message_read_basic(m, 'x', &v);
            out       = (std::int64_t)v;
            break;
        }
        case 't':
        {
            uint64_t v = 0;
            r          = sd_bus_message_read_basic(m, 't', &v);
            out        = (std::int64_t)v;
            break;
        }
        default:
            r = -EINVAL;
            break;
    }
    if (r < 0)
        return r;

    r = sd_bus_message_exit_container(m);
    return r < 0 ? r : 1;
}

// Reads an a{sv} dictionary; undecodable values are left out of the map.
[[maybe_unused]] static inline int read_prop_dict(sd_bus_message *m, PropertyMap &out)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        return r;

    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
    {
        const char *key = nullptr;
        if ((r = sd_bus_message_read_basic(m, 's', &key)) < 0)
            return r;

        PropertyValue v;
        if ((r = read_variant_value(m, v)) < 0)
            return r;
        if (r > 0 && key)
            out[key] = std::move(v);

        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;
    }
    if (r < 0)
        return r;
    return sd_bus_message_exit_container(m);
}

// PropertiesChanged body: (s a{sv} as)
[[maybe_unused]] static inline int read_props_changed(sd_bus_message *m, PropertyChange &out)
{
    const char *iface = nullptr;
    int         r     = sd_bus_message_read_basic(m, 's', &iface);
    if (r < 0)
        return r;
    out.iface = iface ? iface : "";

    if ((r = read_prop_dict(m, out.changed)) < 0)
        return r;

    r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "s");
    if (r < 0)
        return r;
    const char *name = nullptr;
    while ((r = sd_bus_message_read_basic(m, 's', &name)) > 0)
    {
        if (name)
            out.invalidated.emplace_back(name);
    }
    if (r < 0)
        return r;
    r = sd_bus_message_exit_container(m);
    if (r < 0)
        return r;

    const char *path = sd_bus_message_get_path(m);
    out.path         = path ? path : "";
    return 0;
}

}  // namespace bus
