//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <mysqlstream/client_errc.hpp>
#include <mysqlstream/string_view.hpp>

#include "auth/auth.hpp"

#include <openssl/sha.h>

#include <cstddef>
#include <cstring>

using mysqlstream::client_errc;
using mysqlstream::error_code;
using mysqlstream::string_view;

// mysql_native_password
// Authorization for this plugin is always challenge (nonce) -> response
// (hashed password).

static constexpr std::size_t mnp_challenge_length = 20;
static constexpr std::size_t mnp_response_length = 20;
static constexpr const char* mnp_plugin_name = "mysql_native_password";

// challenge must point to challenge_length bytes of data
// output must point to response_length bytes of data
// SHA1( password ) XOR SHA1( "20-bytes random data from server" <concat> SHA1( SHA1( password ) ) )
static void mnp_compute_auth_string(string_view password, const void* challenge, std::uint8_t* output)
{
    // SHA1 (password)
    using sha1_buffer = unsigned char[SHA_DIGEST_LENGTH];
    sha1_buffer password_sha1;
    SHA1(reinterpret_cast<const unsigned char*>(password.data()), password.size(), password_sha1);

    // Add server challenge (salt)
    unsigned char salted_buffer[mnp_challenge_length + SHA_DIGEST_LENGTH];
    std::memcpy(salted_buffer, challenge, mnp_challenge_length);
    SHA1(password_sha1, sizeof(password_sha1), salted_buffer + mnp_challenge_length);
    sha1_buffer salted_sha1;
    SHA1(salted_buffer, sizeof(salted_buffer), salted_sha1);

    // XOR
    static_assert(mnp_response_length == SHA_DIGEST_LENGTH, "Buffer size mismatch");
    for (std::size_t i = 0; i < SHA_DIGEST_LENGTH; ++i)
    {
        output[i] = password_sha1[i] ^ salted_sha1[i];
    }
}

error_code mysqlstream::detail::compute_auth_response(
    string_view plugin_name,
    string_view password,
    boost::asio::const_buffer challenge,
    auth_response& output
)
{
    if (plugin_name != mnp_plugin_name)
        return client_errc::unknown_auth_plugin;

    output.plugin_name = mnp_plugin_name;

    // Blank password: we should just return an empty auth string
    if (password.empty())
    {
        output.data.clear();
        return error_code();
    }

    // Check challenge size
    if (challenge.size() != mnp_challenge_length)
        return client_errc::protocol_value_error;

    output.data.resize(mnp_response_length);
    mnp_compute_auth_string(password, challenge.data(), output.data.data());
    return error_code();
}
