/*
 * Copyright (c) 2014, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef OTPKIT_JSON_JSON_PTR_HPP
#define OTPKIT_JSON_JSON_PTR_HPP

#include "../util/Status.hpp"
#include <jansson.h>
#include <string>

namespace otpkit {

/**
 * A json_t smart pointer.
 */
class JsonPtr
{
public:
    ~JsonPtr();
    JsonPtr();
    JsonPtr(const JsonPtr &copy) = delete;
    JsonPtr &operator=(const JsonPtr &copy) = delete;

    /**
     * Frees the JSON root value and replaces it with a new one.
     * Takes ownership of the passed-in value.
     */
    void
    reset(json_t *root=nullptr);

    /**
     * Loads the JSON object from disk.
     */
    Status
    load(const std::string &filename);

    /**
     * Loads the JSON object from an in-memory string.
     */
    Status
    decode(const std::string &data);

    /**
     * Saves the JSON object to disk.
     */
    Status
    save(const std::string &filename) const;

    /**
     * Saves the JSON object to an in-memory string.
     */
    std::string
    encode() const;

protected:
    json_t *root_;
};

} // namespace otpkit

#endif
