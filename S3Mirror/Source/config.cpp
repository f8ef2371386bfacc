// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The S3Mirror Authors - All Rights Reserved                  *
// *****************************************************************************

#include "config.h"
#include <zenxml/xml.h>

using namespace zen;
using namespace s3m;


namespace
{
const uint64_t BYTES_PER_MIB = 1024 * 1024;

//missing element: keep default
template <class T> inline
void readOptional(const XmlIn& in, T& value)
{
    if (in)
        in(value);
}


void checkXmlMappingErrors(const XmlIn& in, const Zstring& filePath) //throw FileError
{
    if (!in.getErrors().empty())
        throw FileError(replaceCpy("Configuration file %x contains invalid values.", "%x", fmtPath(filePath)),
                        "The following elements could not be read:\n" + in.getErrors());
}


void readConfig(const XmlIn& in, MirrorConfig& cfg, const Zstring& filePath) //throw FileError
{
    XmlIn inSync = in["Sync"];

    readOptional(inSync["Parallel"        ], cfg.syncCfg.parallel);
    readOptional(inSync["DeleteExtraneous"], cfg.syncCfg.deleteExtraneous);
    readOptional(inSync["DryRun"          ], cfg.syncCfg.dryRun);
    readOptional(inSync["Acl"             ], cfg.syncCfg.acl);
    readOptional(inSync["GuessMimeType"   ], cfg.syncCfg.guessMimeType);
    readOptional(inSync["LogFile"         ], cfg.logFilePath);

    std::string contentType;
    readOptional(inSync["ContentType"], contentType);
    if (!trimCpy(contentType).empty())
        cfg.syncCfg.contentType = trimCpy(contentType);

    if (XmlIn inFilter = inSync["Filter"])
    {
        cfg.filterPatterns.clear();
        inFilter.visitChildren([&](XmlIn inPattern)
        {
            std::string pattern;
            if (inPattern(pattern) && !pattern.empty())
                cfg.filterPatterns.push_back(pattern);
        }, "Pattern");
    }

    XmlIn inStore = in["ObjectStore"];

    readOptional(inStore["Endpoint"  ], cfg.login.endpoint);
    readOptional(inStore["Region"    ], cfg.login.region);
    readOptional(inStore["UseTls"    ], cfg.login.useTls);
    readOptional(inStore["PathStyle" ], cfg.login.pathStyle);
    readOptional(inStore["CaCertFile"], cfg.login.caCertFilePath);
    readOptional(inStore["TimeoutSec"], cfg.login.timeoutSec);

    uint64_t partSizeMiB = cfg.login.partSize / BYTES_PER_MIB;
    readOptional(inStore["PartSizeMiB"], partSizeMiB);

    checkXmlMappingErrors(in, filePath); //throw FileError

    //value ranges
    auto throwInvalidValue = [&](const std::string& elementName)
    {
        throw FileError(replaceCpy("Configuration file %x contains invalid values.", "%x", fmtPath(filePath)),
                        replaceCpy("Invalid value for element %x.", "%x", elementName));
    };
    if (cfg.syncCfg.parallel == 0)
        throwInvalidValue("<Sync> <Parallel>");
    if (cfg.login.timeoutSec <= 0)
        throwInvalidValue("<ObjectStore> <TimeoutSec>");
    if (partSizeMiB * BYTES_PER_MIB < S3_MIN_PART_SIZE)
        throwInvalidValue("<ObjectStore> <PartSizeMiB>");
    if (trimCpy(cfg.login.endpoint).empty())
        throwInvalidValue("<ObjectStore> <Endpoint>");

    cfg.login.partSize = partSizeMiB * BYTES_PER_MIB;
}


size_t parsePositiveNumber(const Zstring& value, const char* optionName) //throw FileError
{
    if (value.empty() || !std::all_of(value.begin(), value.end(), [](char c) { return isDigit(c); }) ||
        stringTo<size_t>(value) == 0)
        throw FileError(replaceCpy(replaceCpy("Invalid value %x for command line option %y.", "%x", fmtPath(value)), "%y", optionName),
                        "Expected: positive integer");
    return stringTo<size_t>(value);
}
}


MirrorConfig s3m::readConfig(const Zstring& filePath) //throw FileError
{
    const XmlDoc doc = loadXml(filePath); //throw FileError

    if (doc.root().getName() != "S3Mirror")
        throw FileError(replaceCpy("File %x does not contain a valid configuration.", "%x", fmtPath(filePath)));

    MirrorConfig cfg;
    XmlIn in(doc);
    ::readConfig(in, cfg, filePath); //throw FileError
    return cfg;
}


CommandLine s3m::parseCommandLine(const std::vector<Zstring>& args) //throw FileError
{
    const char* optionConfig      = "-config";
    const char* optionDelete      = "-delete";
    const char* optionDryRun      = "-dryrun";
    const char* optionParallel    = "-parallel";
    const char* optionAcl         = "-acl";
    const char* optionContentType = "-contenttype";
    const char* optionNoGuessMime = "-noguessmime";
    const char* optionPattern     = "-pattern";
    const char* optionEndpoint    = "-endpoint";
    const char* optionRegion      = "-region";
    const char* optionPathStyle   = "-pathstyle";
    const char* optionNoTls       = "-notls";
    const char* optionLogFile     = "-logfile";

    auto isHelpRequest = [](const Zstring& arg)
    {
        auto it = std::find_if(arg.begin(), arg.end(), [](char c) { return c != '/' && c != '-'; });
        if (it == arg.begin()) return false; //require at least one prefix character

        const Zstring argTmp(it, arg.end());
        return equalAsciiNoCase(argTmp, "help") ||
               equalAsciiNoCase(argTmp, "h")    ||
               argTmp == Zstr("?");
    };

    auto getOptionValue = [&](std::vector<Zstring>::const_iterator& it, const char* optionName) -> const Zstring& //throw FileError
    {
        if (++it == args.end())
            throw FileError(replaceCpy("A value is expected after command line option %x.", "%x", optionName));
        return *it;
    };

    CommandLine cmdLine;

    //the configuration file is the base: all other options override it, independent of their position
    for (auto it = args.begin(); it != args.end(); ++it)
        if (isHelpRequest(*it))
        {
            cmdLine.showHelp = true;
            return cmdLine;
        }
        else if (equalAsciiNoCase(*it, optionConfig))
            cmdLine.cfg = readConfig(getOptionValue(it, optionConfig)); //throw FileError

    MirrorConfig& cfg = cmdLine.cfg;
    std::vector<std::string> patterns;
    std::vector<Zstring> positionalArgs;

    for (auto it = args.begin(); it != args.end(); ++it)
        if (equalAsciiNoCase(*it, optionConfig))
            ++it; //already evaluated
        else if (equalAsciiNoCase(*it, optionDelete))
            cfg.syncCfg.deleteExtraneous = true;
        else if (equalAsciiNoCase(*it, optionDryRun))
            cfg.syncCfg.dryRun = true;
        else if (equalAsciiNoCase(*it, optionParallel))
            cfg.syncCfg.parallel = parsePositiveNumber(getOptionValue(it, optionParallel), optionParallel); //throw FileError
        else if (equalAsciiNoCase(*it, optionAcl))
            cfg.syncCfg.acl = getOptionValue(it, optionAcl); //throw FileError
        else if (equalAsciiNoCase(*it, optionContentType))
            cfg.syncCfg.contentType = getOptionValue(it, optionContentType); //throw FileError
        else if (equalAsciiNoCase(*it, optionNoGuessMime))
            cfg.syncCfg.guessMimeType = false;
        else if (equalAsciiNoCase(*it, optionPattern))
            patterns.push_back(getOptionValue(it, optionPattern)); //throw FileError
        else if (equalAsciiNoCase(*it, optionEndpoint))
            cfg.login.endpoint = getOptionValue(it, optionEndpoint); //throw FileError
        else if (equalAsciiNoCase(*it, optionRegion))
            cfg.login.region = getOptionValue(it, optionRegion); //throw FileError
        else if (equalAsciiNoCase(*it, optionPathStyle))
            cfg.login.pathStyle = true;
        else if (equalAsciiNoCase(*it, optionNoTls))
            cfg.login.useTls = false;
        else if (equalAsciiNoCase(*it, optionLogFile))
            cfg.logFilePath = getOptionValue(it, optionLogFile); //throw FileError
        else if (startsWith(*it, '-') && it->size() > 1)
            throw FileError(replaceCpy("Unknown command line option %x.", "%x", fmtPath(*it)));
        else
            positionalArgs.push_back(*it);

    if (!patterns.empty())
        cfg.filterPatterns = patterns;

    if (positionalArgs.size() != 2)
        throw FileError("A source and a destination location are expected.",
                        "Arguments: " + numberTo<std::string>(positionalArgs.size()));

    cmdLine.sourcePath = positionalArgs[0];
    cmdLine.targetPath = positionalArgs[1];
    return cmdLine;
}


std::string s3m::getSyntaxHelp()
{
    const std::string tabSpace(4, ' ');

    return std::string("Syntax:") + '\n' +
           tabSpace + "s3mirror [options] <source> <destination>" + "\n\n" +
           "Locations are local folder paths or s3://bucket/prefix" + "\n\n" +
           "Options:" + '\n' +
           tabSpace + "-Delete              Delete destination files that do not exist in the source" + '\n' +
           tabSpace + "-DryRun              Log planned actions without changing anything" + '\n' +
           tabSpace + "-Parallel <n>        Number of concurrent transfers (default: " + numberTo<std::string>(DEFAULT_PARALLEL) + ")\n" +
           tabSpace + "-Acl <acl>           Canned ACL for uploaded and copied objects, e.g. public-read" + '\n' +
           tabSpace + "-ContentType <type>  Content type for all uploads" + '\n' +
           tabSpace + "-NoGuessMime         Don't detect content types from file content" + '\n' +
           tabSpace + "-Pattern <regex>     Include only files with matching relative path (repeatable)" + '\n' +
           tabSpace + "-Endpoint <host>     Object store endpoint (default: s3.amazonaws.com)" + '\n' +
           tabSpace + "-Region <region>     Signing region (default: AWS_REGION or us-east-1)" + '\n' +
           tabSpace + "-PathStyle           Address buckets as endpoint/bucket instead of bucket.endpoint" + '\n' +
           tabSpace + "-NoTls               Use plain HTTP" + '\n' +
           tabSpace + "-LogFile <path>      Save the log to a file" + '\n' +
           tabSpace + "-Config <file>       Read settings from XML configuration file" + '\n' +
           tabSpace + "-Help                Show this help" + "\n\n" +
           "Credentials are read from AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY and AWS_SESSION_TOKEN." + '\n';
}
