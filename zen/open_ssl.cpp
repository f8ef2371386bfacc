// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "open_ssl.h"
#include "thread.h"
#include "extra_log.h"
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/ssl.h>

using namespace zen;


namespace
{
#ifndef OPENSSL_THREADS
    #error OpenSSL must be built with thread support!
#endif

static_assert(OPENSSL_VERSION_NUMBER >= 0x30000000L, "OpenSSL version is too old!");


std::string formatOpenSSLError(const char* functionName, unsigned long ec)
{
    char errorBuf[256] = {}; //== buffer size used by ERR_error_string(); err.c: it seems the message uses at most ~200 bytes
    ::ERR_error_string_n(ec, errorBuf, sizeof(errorBuf)); //includes null-termination

    return formatSystemError(functionName, "Error code " + numberTo<std::string>(ec), errorBuf);
}


std::string formatLastOpenSSLError(const char* functionName)
{
    const auto ec = ::ERR_peek_last_error(); //"returns latest error code from the thread's error queue without modifying it" - unlike ERR_get_error()
    ::ERR_clear_error(); //clean up for next OpenSSL operation on this thread
    return formatOpenSSLError(functionName, ec);
}
}


void zen::openSslInit()
{
    assert(runningOnMainThread());
    //explicitly init OpenSSL on main thread: https://www.openssl.org/docs/manmaster/man3/OPENSSL_init_ssl.html
    if (::OPENSSL_init_ssl(OPENSSL_INIT_SSL_DEFAULT | OPENSSL_INIT_NO_LOAD_CONFIG, nullptr) != 1)
        logExtraError("Error during process initialization.\n\n" + formatLastOpenSSLError("OPENSSL_init_ssl"));
}


void zen::openSslTearDown() {}
//OpenSSL 1.1.0+ deprecates all clean up functions
namespace
{
struct OpenSslThreadCleanUp
{
    ~OpenSslThreadCleanUp()
    {
        ::OPENSSL_thread_stop();
    }
};
thread_local OpenSslThreadCleanUp tearDownOpenSslThreadData;
}


std::string zen::getSha256(const std::string_view message) //throw SysError
{
    std::string output(EVP_MAX_MD_SIZE, '\0');
    unsigned int bytesWritten = 0;

    //https://www.openssl.org/docs/manmaster/man3/EVP_Digest.html
    if (::EVP_Digest(message.data(),  //const void* data
                     message.size(),  //size_t count
                     reinterpret_cast<unsigned char*>(output.data()), //unsigned char* md
                     &bytesWritten,   //unsigned int* size
                     ::EVP_sha256(),  //const EVP_MD* type
                     nullptr) != 1)   //ENGINE* impl
        throw SysError(formatLastOpenSSLError("EVP_Digest"));

    output.resize(bytesWritten);
    return output;
}


std::string zen::hmacSha256(const std::string_view key, const std::string_view message) //throw SysError
{
    std::string output(EVP_MAX_MD_SIZE, '\0');
    size_t bytesWritten = 0;

    //https://www.openssl.org/docs/manmaster/man3/EVP_Q_mac.html
    if (!::EVP_Q_mac(nullptr,        //OSSL_LIB_CTX* libctx
                     "HMAC",         //const char* name
                     nullptr,        //const char* propq
                     "SHA256",       //const char* subalg
                     nullptr,        //const OSSL_PARAM* params
                     key.data(),     //const void* key
                     key.size(),     //size_t keylen
                     reinterpret_cast<const unsigned char*>(message.data()), //const unsigned char* data
                     message.size(), //size_t datalen
                     reinterpret_cast<unsigned char*>(output.data()), //unsigned char* out
                     output.size(),  //size_t outsize
                     &bytesWritten)) //size_t* outlen
        throw SysError(formatLastOpenSSLError("EVP_Q_mac"));

    output.resize(bytesWritten);
    return output;
}


std::string zen::formatAsHexString(const std::string_view blob)
{
    std::string output;
    output.reserve(blob.size() * 2);
    for (const char c : blob)
    {
        const auto [high, low] = hexify(static_cast<unsigned char>(c), false /*upperCase*/);
        output += high;
        output += low;
    }
    return output;
}


std::string zen::getSha256Hex(const std::string_view message) //throw SysError
{
    return formatAsHexString(getSha256(message)); //throw SysError
}
