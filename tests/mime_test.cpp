// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The S3Mirror Authors - All Rights Reserved                  *
// *****************************************************************************

#include <gtest/gtest.h>
#include "afs/mime.h"
#include "test_utils.h"

using namespace zen;
using namespace s3m;
using namespace s3m::test;


TEST(LibMagicSniffer, DetectsTypeFromContent)
{
    TempFolder tmp;
    writeFile(tmp / "notes.bin", "plain text content\nsecond line\n");

    const std::string pngHeader("\x89PNG\r\n\x1a\n"
                                "\x00\x00\x00\x0d" "IHDR"
                                "\x00\x00\x00\x01" "\x00\x00\x00\x01" "\x08\x06\x00\x00\x00"
                                "\x1f\x15\xc4\x89", 33);
    writeFile(tmp / "image.txt", pngHeader); //extension must not matter

    LibMagicSniffer sniffer;
    EXPECT_EQ(sniffer.detectMimeType(tmp / "notes.bin"), "text/plain");
    EXPECT_EQ(sniffer.detectMimeType(tmp / "image.txt"), "image/png");
}


TEST(LibMagicSniffer, MissingFileIsError)
{
    TempFolder tmp;
    LibMagicSniffer sniffer;
    EXPECT_THROW(sniffer.detectMimeType(tmp / "missing.txt"), SysError);
}
