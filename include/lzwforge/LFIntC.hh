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

#ifndef LFINTC_HH
#define LFINTC_HH

#include <lzwforge/DLL.h>
#include <lzwforge/Types.h>

#include <cstddef>
#include <limits>
#include <locale>
#include <sstream>
#include <stdexcept>
#include <type_traits>

// Safe integer conversion that detects overflows and throws std::range_error. Bit counts in
// lzwforge routinely cross between size_t, unsigned long long and the offset type, so every such
// narrowing goes through here.
namespace LFIntC // LFIntC = lzwforge Integer Conversion
{
    template <typename From,
              typename To,
              bool From_signed = std::numeric_limits<From>::is_signed,
              bool To_signed = std::numeric_limits<To>::is_signed>
    class IntConverter
    {
    };

    template <typename From, typename To>
    void
    conversion_error(From const& i, char const* from_kind, char const* to_kind)
    {
        std::ostringstream msg;
        msg.imbue(std::locale::classic());
        msg << "integer out of range converting " << i << " from a " << sizeof(From) << "-byte "
            << from_kind << " type to a " << sizeof(To) << "-byte " << to_kind << " type";
        throw std::range_error(msg.str());
    }

    template <typename From, typename To>
    class IntConverter<From, To, false, false>
    {
      public:
        static To
        convert(From const& i)
        {
            if (i > std::numeric_limits<To>::max()) {
                conversion_error<From, To>(i, "unsigned", "unsigned");
            }
            return static_cast<To>(i);
        }
    };

    template <typename From, typename To>
    class IntConverter<From, To, true, true>
    {
      public:
        static To
        convert(From const& i)
        {
            if ((i < std::numeric_limits<To>::min()) || (i > std::numeric_limits<To>::max())) {
                conversion_error<From, To>(i, "signed", "signed");
            }
            return static_cast<To>(i);
        }
    };

    template <typename From, typename To>
    class IntConverter<From, To, true, false>
    {
      public:
        static To
        convert(From const& i)
        {
            // A non-negative i can be compared with To's max as the corresponding unsigned type.
            auto ii = static_cast<typename std::make_unsigned<From>::type>(i);
            if ((i < 0) || (ii > std::numeric_limits<To>::max())) {
                conversion_error<From, To>(i, "signed", "unsigned");
            }
            return static_cast<To>(i);
        }
    };

    template <typename From, typename To>
    class IntConverter<From, To, false, true>
    {
      public:
        static To
        convert(From const& i)
        {
            auto maxval =
                static_cast<typename std::make_unsigned<To>::type>(std::numeric_limits<To>::max());
            if (i > maxval) {
                conversion_error<From, To>(i, "unsigned", "signed");
            }
            return static_cast<To>(i);
        }
    };

    // Specific converters. The return type of each function must match the second template
    // parameter to IntConverter.
    template <typename T>
    unsigned char
    to_uchar(T const& i)
    {
        return IntConverter<T, unsigned char>::convert(i);
    }

    template <typename T>
    int
    to_int(T const& i)
    {
        return IntConverter<T, int>::convert(i);
    }

    template <typename T>
    unsigned int
    to_uint(T const& i)
    {
        return IntConverter<T, unsigned int>::convert(i);
    }

    template <typename T>
    size_t
    to_size(T const& i)
    {
        return IntConverter<T, size_t>::convert(i);
    }

    template <typename T>
    unsigned long long
    to_ulonglong(T const& i)
    {
        return IntConverter<T, unsigned long long>::convert(i);
    }

    template <typename T>
    lzwforge_offset_t
    to_offset(T const& i)
    {
        return IntConverter<T, lzwforge_offset_t>::convert(i);
    }
} // namespace LFIntC

#endif // LFINTC_HH
