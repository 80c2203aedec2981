/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef OTPC_JSON_JSON_OBJECT_HPP
#define OTPC_JSON_JSON_OBJECT_HPP

#include "JsonPtr.hpp"

namespace otpc {

/**
 * A JsonPtr with an object (key-value pair) as it's root element.
 * This allows all sorts of member lookups.
 */
class JsonObject:
    public JsonPtr
{
public:
    OTPC_JSON_CONSTRUCTORS(JsonObject, JsonPtr)

    /**
     * Returns true if the root object has the given key.
     */
    bool
    hasKey(const char *key) const;

protected:
    // Type helpers:
    Status hasString (const char *key) const;
    Status hasInteger(const char *key) const;

    // Read helpers:
    const char *getString (const char *key, const char *fallback) const;
    json_int_t  getInteger(const char *key, json_int_t fallback) const;
};

// Helper macros for implementing JsonObject child classes:

#define OTPC_JSON_STRING(name, key, fallback) \
    const char *name() const                    { return getString(key, fallback); } \
    otpc::Status name##Ok() const               { return hasString(key); }

#define OTPC_JSON_INTEGER(name, key, fallback) \
    json_int_t name() const                     { return getInteger(key, fallback); } \
    otpc::Status name##Ok() const               { return hasInteger(key); }

} // namespace otpc

#endif
