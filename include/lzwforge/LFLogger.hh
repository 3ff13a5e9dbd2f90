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

#ifndef LFLOGGER_HH
#define LFLOGGER_HH

#include <lzwforge/DLL.h>
#include <lzwforge/Pipeline.hh>

#include <memory>
#include <string>

// Routes lzwforge's messages and binary output. Each destination is a Pipeline:
//
// info -- progress and summary messages; standard output unless save is standard output, in
//         which case standard error
// warn -- warnings; follows error unless set explicitly
// error -- errors; standard error
// save -- binary output, such as a fixture written to standard output; undefined unless set
//
// In general, use the default logger. Create a separate logger when output needs to be captured
// or isolated, as the tests do. On destruction, finish() is called for the standard output and
// standard error pipelines. If you supply custom pipelines, you must finish them yourself.
//
// Never set the save pipeline to the same destination as anything else, or the binary output will
// be corrupted by messages. To save to standard output, call saveToStandardOutput(), which throws
// std::logic_error if standard output has already been used and moves info to standard error if
// info is currently standard output.
class LFLogger
{
  public:
    LZWFORGE_DLL
    static std::shared_ptr<LFLogger> create();

    // Return the default logger.
    LZWFORGE_DLL
    static std::shared_ptr<LFLogger> defaultLogger();

    LZWFORGE_DLL
    void info(char const*);
    LZWFORGE_DLL
    void info(std::string const&);
    LZWFORGE_DLL
    std::shared_ptr<Pipeline> getInfo(bool null_okay = false);

    LZWFORGE_DLL
    void warn(char const*);
    LZWFORGE_DLL
    void warn(std::string const&);
    LZWFORGE_DLL
    std::shared_ptr<Pipeline> getWarn(bool null_okay = false);

    LZWFORGE_DLL
    void error(char const*);
    LZWFORGE_DLL
    void error(std::string const&);
    LZWFORGE_DLL
    std::shared_ptr<Pipeline> getError(bool null_okay = false);

    LZWFORGE_DLL
    std::shared_ptr<Pipeline> getSave(bool null_okay = false);

    LZWFORGE_DLL
    std::shared_ptr<Pipeline> standardOutput();
    LZWFORGE_DLL
    std::shared_ptr<Pipeline> standardError();
    LZWFORGE_DLL
    std::shared_ptr<Pipeline> discard();

    // Passing a null pointer resets to default
    LZWFORGE_DLL
    void setInfo(std::shared_ptr<Pipeline>);
    LZWFORGE_DLL
    void setWarn(std::shared_ptr<Pipeline>);
    LZWFORGE_DLL
    void setError(std::shared_ptr<Pipeline>);
    // See notes above about the save pipeline
    LZWFORGE_DLL
    void setSave(std::shared_ptr<Pipeline>, bool only_if_not_set);
    LZWFORGE_DLL
    void saveToStandardOutput(bool only_if_not_set);

  private:
    LFLogger();
    std::shared_ptr<Pipeline> throwIfNull(std::shared_ptr<Pipeline>, bool null_okay);

    class Members;

    std::shared_ptr<Members> m;
};

#endif // LFLOGGER_HH
