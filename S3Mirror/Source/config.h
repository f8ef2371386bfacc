// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The S3Mirror Authors - All Rights Reserved                  *
// *****************************************************************************

#ifndef CONFIG_H_3948570129384756
#define CONFIG_H_3948570129384756

#include "base/sync_manager.h"
#include "afs/s3.h"


namespace s3m
{
struct MirrorConfig
{
    SyncConfig syncCfg;
    std::vector<std::string> filterPatterns; //regular expressions
    Zstring logFilePath;                     //optional
    S3Login login;                           //credentials are not part of the configuration
};

//<S3Mirror> document; missing elements keep their default values
MirrorConfig readConfig(const Zstring& filePath); //throw FileError


struct CommandLine
{
    bool showHelp = false;
    Zstring sourcePath;
    Zstring targetPath;
    MirrorConfig cfg; //configuration file (if any) with command line overrides applied
};

CommandLine parseCommandLine(const std::vector<Zstring>& args); //throw FileError

std::string getSyntaxHelp();
}

#endif //CONFIG_H_3948570129384756
