// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The S3Mirror Authors - All Rights Reserved                  *
// *****************************************************************************

#ifndef MIME_H_1029384756473829
#define MIME_H_1029384756473829

#include <mutex>
#include <zen/sys_error.h>

struct magic_set; //libmagic: magic_t


namespace s3m
{
class MimeSniffer
{
public:
    virtual ~MimeSniffer() {}

    //thread-safe; e.g. "text/plain"
    virtual std::string detectMimeType(const Zstring& filePath) = 0; //throw SysError
};


//content-based detection via libmagic
class LibMagicSniffer : public MimeSniffer
{
public:
    LibMagicSniffer(); //throw SysError
    ~LibMagicSniffer();

    std::string detectMimeType(const Zstring& filePath) override; //throw SysError

private:
    LibMagicSniffer           (const LibMagicSniffer&) = delete;
    LibMagicSniffer& operator=(const LibMagicSniffer&) = delete;

    ::magic_set* cookie_ = nullptr;
    std::mutex lockCookie_; //magic_t is not thread-safe
};
}

#endif //MIME_H_1029384756473829
