// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The S3Mirror Authors - All Rights Reserved                  *
// *****************************************************************************

#include "transfer.h"
#include <zen/extra_log.h>
#include <zen/file_io.h>

using namespace zen;
using namespace s3m;


void TransferExecutor::logAction(const std::string& msg)
{
    cb_.logMessage(cfg_.dryRun ? msg + " [dry run]" : msg, MSG_TYPE_INFO);
}


std::string TransferExecutor::getContentType(const Zstring& filePath) //throw SysError
{
    if (cfg_.contentType)
        return *cfg_.contentType;

    if (cfg_.guessMimeType && mimeSniffer_)
        return mimeSniffer_->detectMimeType(filePath); //throw SysError

    return std::string();
}


void TransferExecutor::copyObjectToObject(const FileEntry& file, const S3Path& sourceRoot, const S3Path& targetRoot) //throw FileError
{
    const std::string targetKey = getRemoteTargetKey(targetRoot, file);

    const std::string sourceDisplay = displayS3Path(sourceRoot.bucket, file.fullPath);
    const std::string targetDisplay = displayS3Path(targetRoot.bucket, targetKey);

    logAction(replaceCpy(replaceCpy("Copying file %x to %y.", "%x", fmtPath(sourceDisplay)), "%y", fmtPath(targetDisplay)));
    if (cfg_.dryRun)
        return;

    try
    {
        store_.copyObject(targetRoot.bucket, sourceRoot.bucket + '/' + file.fullPath, targetKey, cfg_.acl); //throw SysError
    }
    catch (const SysError& e)
    {
        throw FileError(replaceCpy(replaceCpy("Cannot copy file %x to %y.", "%x", fmtPath(sourceDisplay)), "%y", fmtPath(targetDisplay)), e.toString());
    }

    stats_.addTransfer(file.fileSize);
}


void TransferExecutor::download(const FileEntry& file, const S3Path& sourceRoot, const LocalPath& targetRoot) //throw FileError
{
    const Zstring targetPath = getLocalTargetPath(targetRoot, file);
    const std::string sourceDisplay = displayS3Path(sourceRoot.bucket, file.fullPath);

    logAction(replaceCpy(replaceCpy("Downloading file %x to %y.", "%x", fmtPath(sourceDisplay)), "%y", fmtPath(targetPath)));
    if (cfg_.dryRun)
        return;

    if (const std::optional<Zstring> parentPath = getParentFolderPath(targetPath))
        createDirectoryIfMissingRecursion(*parentPath); //throw FileError

    //write to temporary file first: never leave a partially downloaded file under the target name
    const Zstring tmpPath = getPathWithTempName(targetPath);

    uint64_t bytesWritten = 0;
    {
        FileOutputPlain fileOut(tmpPath); //throw FileError, ErrorTargetExisting
        try
        {
            bytesWritten = store_.getObject(sourceRoot.bucket, file.fullPath, [&](std::span<const char> buf) //throw SysError, FileError
            {
                fileOut.write(buf.data(), buf.size()); //throw FileError
            });
        }
        catch (const SysError& e)
        {
            throw FileError(replaceCpy(replaceCpy("Cannot download file %x to %y.", "%x", fmtPath(sourceDisplay)), "%y", fmtPath(targetPath)), e.toString());
        }
        fileOut.close(); //throw FileError
    }
    //take over ownership:
    ZEN_ON_SCOPE_FAIL( try { removeFilePlain(tmpPath); }
    catch (const FileError& e) { logExtraError(e.toString()); });

    moveAndRenameItem(tmpPath, targetPath, true /*replaceExisting*/); //throw FileError, (ErrorTargetExisting)

    setFileTime(targetPath, file.modTime); //throw FileError

    stats_.addTransfer(bytesWritten);
}


void TransferExecutor::upload(const FileEntry& file, const LocalPath& /*sourceRoot*/, const S3Path& targetRoot) //throw FileError
{
    const Zstring& sourcePath = file.fullPath;
    const std::string targetKey = getRemoteTargetKey(targetRoot, file);
    const std::string targetDisplay = displayS3Path(targetRoot.bucket, targetKey);

    logAction(replaceCpy(replaceCpy("Uploading file %x to %y.", "%x", fmtPath(sourcePath)), "%y", fmtPath(targetDisplay)));
    if (cfg_.dryRun)
        return;

    const std::string errorMsg = replaceCpy(replaceCpy("Cannot upload file %x to %y.", "%x", fmtPath(sourcePath)), "%y", fmtPath(targetDisplay));

    PutObjectOptions options;
    options.acl      = cfg_.acl;
    options.partSize = cfg_.partSize;
    try
    {
        options.contentType = getContentType(sourcePath); //throw SysError
    }
    catch (const SysError& e) { throw FileError(errorMsg, e.toString()); }

    FileInputPlain fileIn(sourcePath); //throw FileError
    const uint64_t fileSize = fileIn.getStatBuffered().st_size; //throw FileError

    try
    {
        store_.putObject(targetRoot.bucket, targetKey, [&](std::span<char> buf) //throw SysError, FileError
        {
            return fileIn.read(buf.data(), buf.size()); //throw FileError
        }, fileSize, options);
    }
    catch (const SysError& e) { throw FileError(errorMsg, e.toString()); }

    stats_.addTransfer(fileSize);
}


void TransferExecutor::deleteLocal(const FileEntry& file, const LocalPath& targetRoot) //throw FileError
{
    const Zstring targetPath = getLocalTargetPath(targetRoot, file);

    logAction(replaceCpy("Deleting file %x.", "%x", fmtPath(targetPath)));
    if (cfg_.dryRun)
        return;

    removeFilePlain(targetPath); //throw FileError

    stats_.addDeletion();
}


void TransferExecutor::deleteRemote(const FileEntry& file, const S3Path& targetRoot) //throw FileError
{
    const std::string targetKey = getRemoteTargetKey(targetRoot, file);
    const std::string targetDisplay = displayS3Path(targetRoot.bucket, targetKey);

    logAction(replaceCpy("Deleting file %x.", "%x", fmtPath(targetDisplay)));
    if (cfg_.dryRun)
        return;

    try
    {
        store_.deleteObject(targetRoot.bucket, targetKey); //throw SysError
    }
    catch (const SysError& e) { throw FileError(replaceCpy("Cannot delete file %x.", "%x", fmtPath(targetDisplay)), e.toString()); }

    stats_.addDeletion();
}
