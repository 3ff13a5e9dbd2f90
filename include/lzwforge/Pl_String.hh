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

// End-of-line pipeline that appends everything written to it to a caller-owned std::string. If a
// next pipeline is given, data is also passed through to it. The packer uses this to produce
// fixtures in memory, and tests use it to capture logger output.
//
// This pipeline is reusable.

#ifndef PL_STRING_HH
#define PL_STRING_HH

#include <lzwforge/Pipeline.hh>

#include <memory>
#include <string>

class LZWFORGE_DLL_CLASS Pl_String: public Pipeline
{
  public:
    LZWFORGE_DLL
    Pl_String(char const* identifier, Pipeline* next, std::string& s);
    LZWFORGE_DLL
    ~Pl_String() override;

    LZWFORGE_DLL
    void write(unsigned char const* buf, size_t len) override;
    LZWFORGE_DLL
    void finish() override;

  private:
    class Members;

    std::unique_ptr<Members> m;
};

#endif // PL_STRING_HH
