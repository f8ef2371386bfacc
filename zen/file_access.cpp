// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "file_access.h"
#include <ctime>
#include <deque>
#include <variant>
#include <fcntl.h> //AT_FDCWD
#include <unistd.h>

using namespace zen;


namespace
{
struct SysErrorCode : public zen::SysError
{
    SysErrorCode(const std::string& functionName, ErrorCode ec) : SysError(formatSystemError(functionName, ec)), errorCode(ec) {}

    const ErrorCode errorCode;
};


ItemType getItemTypeImpl(const Zstring& itemPath) //throw SysErrorCode
{
    struct stat itemInfo = {};
    if (::lstat(itemPath.c_str(), &itemInfo) != 0)
        throw SysErrorCode("lstat", errno);

    if (S_ISLNK(itemInfo.st_mode))
        return ItemType::symlink;
    if (S_ISDIR(itemInfo.st_mode))
        return ItemType::folder;
    return ItemType::file; //S_ISREG || S_ISCHR || S_ISBLK || S_ISFIFO || S_ISSOCK
}


std::variant<ItemType, Zstring /*last existing parent path*/> getItemTypeIfExistsImpl(const Zstring& itemPath) //throw SysError
{
    try
    {
        //fast check: 1. perf 2. expected by getFileDetails()
        return getItemTypeImpl(itemPath); //throw SysErrorCode
    }
    catch (const SysErrorCode& e) //let's dig deeper, but *only* if error code sounds like "not existing"
    {
        if (e.errorCode != ENOENT &&
            e.errorCode != ENOTDIR) //a parent path component is not a folder
            throw;

        if (const std::optional<Zstring> parentPath = getParentFolderPath(itemPath))
        {
            const std::variant<ItemType, Zstring> parentTypeOrPath = getItemTypeIfExistsImpl(*parentPath); //throw SysError

            if (const ItemType* parentType = std::get_if<ItemType>(&parentTypeOrPath))
            {
                if (*parentType == ItemType::file /*obscure, but possible*/)
                    throw SysError(replaceCpy("The name %x is already used by another item.", "%x", fmtPath(getItemName(*parentPath))));

                return *parentPath;
            }
            return parentTypeOrPath;
        }
        throw; //device root not existing!?
    }
}
}


ItemType zen::getItemType(const Zstring& itemPath) //throw FileError
{
    try
    {
        return getItemTypeImpl(itemPath); //throw SysErrorCode
    }
    catch (const SysError& e) { throw FileError(replaceCpy("Cannot read file attributes of %x.", "%x", fmtPath(itemPath)), e.toString()); }
}


std::optional<ItemType> zen::getItemTypeIfExists(const Zstring& itemPath) //throw FileError
{
    try
    {
        const std::variant<ItemType, Zstring /*last existing parent path*/> typeOrPath = getItemTypeIfExistsImpl(itemPath); //throw SysError
        if (const ItemType* type = std::get_if<ItemType>(&typeOrPath))
            return *type;
        else
            return std::nullopt;
    }
    catch (const SysError& e)
    {
        throw FileError(replaceCpy("Cannot read file attributes of %x.", "%x", fmtPath(itemPath)), e.toString());
    }
}


FileDetails zen::getFileDetails(const Zstring& itemPath) //throw FileError
{
    struct stat itemInfo = {};
    if (::stat(itemPath.c_str(), &itemInfo) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy("Cannot read file attributes of %x.", "%x", fmtPath(itemPath)), "stat");

    return
    {
        .fileSize = static_cast<uint64_t>(itemInfo.st_size),
        .modTime  = itemInfo.st_mtim.tv_sec, //round down like Windows Explorer
        .isFolder = S_ISDIR(itemInfo.st_mode),
    };
}


uint64_t zen::getFileSize(const Zstring& filePath) //throw FileError
{
    try
    {
        struct stat fileInfo = {};
        if (::stat(filePath.c_str(), &fileInfo) != 0)
            THROW_LAST_SYS_ERROR("stat");

        return fileInfo.st_size;
    }
    catch (const SysError& e) { throw FileError(replaceCpy("Cannot read file attributes of %x.", "%x", fmtPath(filePath)), e.toString()); }
}


void zen::setFileTime(const Zstring& filePath, time_t modTime) //throw FileError
{
    //same approach as "cp" and "touch": utimensat() on the (followed) path
    const timespec newTimes[2]
    {
        {.tv_sec = ::time(nullptr), .tv_nsec = 0}, //access time
        {.tv_sec = modTime,         .tv_nsec = 0}, //modification time
    };

    if (::utimensat(AT_FDCWD, filePath.c_str(), newTimes, 0) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy("Cannot write modification time of %x.", "%x", fmtPath(filePath)), "utimensat");
}


Zstring zen::getCurrentWorkingDirectory() //throw FileError
{
    char* buf = ::getcwd(nullptr, 0); //GNU extension: allocate buffer
    if (!buf)
        THROW_LAST_FILE_ERROR("Cannot get current working directory.", "getcwd");
    ZEN_ON_SCOPE_EXIT(::free(buf));

    return buf;
}


void zen::removeFilePlain(const Zstring& filePath) //throw FileError
{
    try
    {
        if (::unlink(filePath.c_str()) != 0)
            THROW_LAST_SYS_ERROR("unlink");
    }
    catch (const SysError& e) { throw FileError(replaceCpy("Cannot delete file %x.", "%x", fmtPath(filePath)), e.toString()); }
}


void zen::moveAndRenameItem(const Zstring& pathFrom, const Zstring& pathTo, bool replaceExisting) //throw FileError, ErrorTargetExisting
{
    auto getErrorMsg = [&] { return replaceCpy(replaceCpy("Cannot move file %x to %y.", "%x", '\n' + fmtPath(pathFrom)), "%y", '\n' + fmtPath(pathTo)); };

    //rename() will never fail with EEXIST, but always (atomically) overwrite!
    if (!replaceExisting)
    {
        struct stat sourceInfo = {};
        if (::lstat(pathFrom.c_str(), &sourceInfo) != 0)
            throw FileError(getErrorMsg(), formatSystemError("lstat(source)", errno));

        struct stat targetInfo = {};
        if (::lstat(pathTo.c_str(), &targetInfo) != 0)
        {
            if (errno != ENOENT)
                throw FileError(getErrorMsg(), formatSystemError("lstat(target)", errno));
        }
        else if (sourceInfo.st_dev != targetInfo.st_dev ||
                 sourceInfo.st_ino != targetInfo.st_ino)
            throw ErrorTargetExisting(getErrorMsg(), replaceCpy("The name %x is already used by another item.", "%x", fmtPath(getItemName(pathTo))));
    }

    if (::rename(pathFrom.c_str(), pathTo.c_str()) != 0)
        THROW_LAST_FILE_ERROR(getErrorMsg(), "rename");
}


void zen::createDirectory(const Zstring& dirPath) //throw FileError, ErrorTargetExisting
{
    try
    {
        //don't allow creating irregular folders!
        const Zstring dirName = getItemName(dirPath);

        if (std::all_of(dirName.begin(), dirName.end(), [](Zchar c) { return c == Zstr('.'); }))
            throw SysError(replaceCpy("Invalid folder name %x.", "%x", fmtPath(dirName)));

        const mode_t mode = S_IRWXU | S_IRWXG | S_IRWXO; //0777 => consider umask!

        if (::mkdir(dirPath.c_str(), mode) != 0)
        {
            const int ec = errno; //copy before directly or indirectly making other system calls!
            if (ec == EEXIST)
                throw ErrorTargetExisting(replaceCpy("Cannot create directory %x.", "%x", fmtPath(dirPath)), formatSystemError("mkdir", ec));
            THROW_LAST_SYS_ERROR("mkdir");
        }
    }
    catch (const SysError& e) { throw FileError(replaceCpy("Cannot create directory %x.", "%x", fmtPath(dirPath)), e.toString()); }
}


void zen::createDirectoryIfMissingRecursion(const Zstring& dirPath) //throw FileError
{
    try
    {
        //- path most likely already exists => check first
        //- parallel downloads race to create the same parents: EEXIST for a folder is success
        Zstring dirPathEx = dirPath;
        std::deque<Zstring> dirNames;
        for (;;)
        {
            const std::optional<ItemType> type = getItemTypeIfExists(dirPathEx); //throw FileError
            if (type)
            {
                if (*type == ItemType::file /*obscure, but possible*/)
                    throw SysError(replaceCpy("The name %x is already used by another item.", "%x", fmtPath(getItemName(dirPathEx))));
                break;
            }

            const std::optional<Zstring> parentPath = getParentFolderPath(dirPathEx);
            if (!parentPath) //device root
                break;
            dirNames.push_front(getItemName(dirPathEx));
            dirPathEx = *parentPath;
        }
        //-----------------------------------------------------------

        Zstring dirPathNew = dirPathEx;
        for (const Zstring& dirName : dirNames)
        {
            dirPathNew = appendPath(dirPathNew, dirName);
            try
            {
                createDirectory(dirPathNew); //throw FileError, ErrorTargetExisting
            }
            catch (ErrorTargetExisting&)
            {
                //already existing => possible, if createDirectoryIfMissingRecursion() is run in parallel
                if (getItemType(dirPathNew) == ItemType::file) //throw FileError
                    throw SysError(replaceCpy("The name %x is already used by another item.", "%x", fmtPath(getItemName(dirPathNew))));
            }
        }
    }
    catch (const SysError& e)
    {
        throw FileError(replaceCpy("Cannot create directory %x.", "%x", fmtPath(dirPath)), e.toString());
    }
}
