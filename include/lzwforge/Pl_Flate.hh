// Copyright (c) 2024-2026 The lzwforge Authors
//
// This file is part of lzwforge.
//
// Licensed under the Apache License, Version 2.0 (the "License"); you may not use this file except
// in compliance with the License. You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software distributed under the License
// is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express
// or implied. See the License for the specific language governing permissions and limitations under
// the License.

// zlib deflate/inflate pipeline. lzwforge uses it to store fixtures compressed and to produce data
// for a FlateDecode + LZWDecode filter chain. The packed LZW codes are always produced first and
// then deflated, so inflating the output yields the raw fixture byte for byte.

#ifndef PL_FLATE_HH
#define PL_FLATE_HH

#include <lzwforge/Pipeline.hh>

#include <functional>
#include <memory>

class LZWFORGE_DLL_CLASS Pl_Flate: public Pipeline
{
  public:
    static unsigned int const def_bufsize = 65536;

    enum action_e { a_inflate, a_deflate };

    LZWFORGE_DLL
    Pl_Flate(
        char const* identifier,
        Pipeline* next,
        action_e action,
        unsigned int out_bufsize = def_bufsize);
    LZWFORGE_DLL
    ~Pl_Flate() override;

    LZWFORGE_DLL
    void write(unsigned char const* data, size_t len) override;
    LZWFORGE_DLL
    void finish() override;

    // Globally set compression level from 1 (fastest, least compression) to 9 (slowest, most
    // compression). Use -1 to set the default compression level. This is passed directly to zlib.
    LZWFORGE_DLL
    static void setCompressionLevel(int);

    // Called with a message and the zlib error code for conditions that do not prevent the output
    // from being used.
    LZWFORGE_DLL
    void setWarnCallback(std::function<void(char const*, int)> callback);

  private:
    LZWFORGE_DLL_PRIVATE
    void initialize();
    LZWFORGE_DLL_PRIVATE
    void handleData(unsigned char const* data, size_t len, int flush);
    LZWFORGE_DLL_PRIVATE
    void writeOutput();
    LZWFORGE_DLL_PRIVATE
    void checkError(char const* prefix, int error_code);

    LZWFORGE_DLL_PRIVATE
    static int compression_level;

    class Members;

    std::unique_ptr<Members> m;
};

#endif // PL_FLATE_HH
