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

#ifndef PL_COUNT_HH
#define PL_COUNT_HH

#include <lzwforge/Pipeline.hh>
#include <lzwforge/Types.h>

// Pass-through pipeline that counts the bytes written through it. The CLI places one in front of
// the output file to report the size of the fixture it wrote, including after compression.
//
// This pipeline is reusable; i.e., it is safe to call write() after calling finish().
class LZWFORGE_DLL_CLASS Pl_Count: public Pipeline
{
  public:
    LZWFORGE_DLL
    Pl_Count(char const* identifier, Pipeline* next);
    LZWFORGE_DLL
    ~Pl_Count() override;
    LZWFORGE_DLL
    void write(unsigned char const*, size_t) override;
    LZWFORGE_DLL
    void finish() override;
    // Returns the number of bytes written
    LZWFORGE_DLL
    lzwforge_offset_t getCount() const;

  private:
    class Members;

    std::unique_ptr<Members> m;
};

#endif // PL_COUNT_HH
