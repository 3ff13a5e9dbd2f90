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

// Generalized Pipeline interface. By convention, subclasses of Pipeline are called Pl_Something.
//
// A Pipeline created with a pointer to a next pipeline writes its data to the next one as it
// produces it. The allocator of a pipeline is responsible for its destruction; one pipeline never
// manages the memory of its successor. This makes it possible to pass a pipeline to a function that
// places other pipelines in front of it, which is how the fixture writer optionally compresses its
// output.
//
// The client must call finish() before destroying a Pipeline in order to avoid loss of data. A
// Pipeline must not throw from its destructor if this hasn't been done.

#ifndef PIPELINE_HH
#define PIPELINE_HH

#include <lzwforge/DLL.h>

#include <cstddef>
#include <memory>
#include <string>
#include <type_traits>

// Remember to use LZWFORGE_DLL_CLASS on anything derived from Pipeline so it will work with
// dynamic_cast across the shared object boundary.
class LZWFORGE_DLL_CLASS Pipeline
{
  public:
    LZWFORGE_DLL
    Pipeline(char const* identifier, Pipeline* next);

    LZWFORGE_DLL
    virtual ~Pipeline() = default;

    // Subclasses implement write and finish to do their jobs and then, if they are not end-of-line
    // pipelines, call next()->write or next()->finish.
    LZWFORGE_DLL
    virtual void write(unsigned char const* data, size_t len) = 0;
    LZWFORGE_DLL
    virtual void finish() = 0;
    LZWFORGE_DLL
    std::string getIdentifier() const;

    // Convenience methods for writing text to pipelines without casting. The char const* versions
    // expect null-terminated strings and do not write the terminator.
    LZWFORGE_DLL
    void writeCStr(char const* cstr);
    LZWFORGE_DLL
    void writeString(std::string const&);
    // This allows *p << "x" << 1 but is not a general purpose ostream replacement.
    LZWFORGE_DLL
    Pipeline& operator<<(char const* cstr);
    LZWFORGE_DLL
    Pipeline& operator<<(std::string const&);
    // Integers are written in decimal. char and bool are excluded so they aren't mistaken for
    // numbers.
    template <typename T>
    std::enable_if_t<
        std::is_integral_v<T> && !std::is_same_v<T, char> && !std::is_same_v<T, bool>,
        Pipeline&>
    operator<<(T i)
    {
        writeString(std::to_string(i));
        return *this;
    }

    // Overloaded write to reduce casting
    LZWFORGE_DLL
    void write(char const* data, size_t len);

  protected:
    // Throws std::logic_error if there is no next pipeline unless allow_null is true.
    LZWFORGE_DLL
    Pipeline* getNext(bool allow_null = false);
    Pipeline*
    next() const noexcept
    {
        return next_;
    }
    std::string identifier;

  private:
    Pipeline(Pipeline const&) = delete;
    Pipeline& operator=(Pipeline const&) = delete;

    Pipeline* next_;
};

#endif // PIPELINE_HH
