#include <lzwforge/LFLogger.hh>

#include <lzwforge/LFUtil.hh>

#include <iostream>
#include <stdexcept>

namespace
{
    class Pl_OStream: public Pipeline
    {
      public:
        Pl_OStream(char const* identifier, std::ostream& os) :
            Pipeline(identifier, nullptr),
            os(os)
        {
        }

        void
        write(unsigned char const* data, size_t len) override
        {
            os.write(reinterpret_cast<char const*>(data), static_cast<std::streamsize>(len));
        }

        void
        finish() override
        {
            os.flush();
        }

      private:
        std::ostream& os;
    };

    class Pl_Discard: public Pipeline
    {
      public:
        Pl_Discard() :
            Pipeline("discard", nullptr)
        {
        }

        void
        write(unsigned char const*, size_t) override
        {
        }

        void
        finish() override
        {
        }
    };

    // Remembers whether anything was written so setSave can refuse to share standard output.
    class Pl_Track: public Pipeline
    {
      public:
        Pl_Track(char const* identifier, Pipeline* next) :
            Pipeline(identifier, next)
        {
        }

        void
        write(unsigned char const* data, size_t len) override
        {
            this->used = true;
            getNext()->write(data, len);
        }

        void
        finish() override
        {
            getNext()->finish();
        }

        bool
        getUsed() const
        {
            return used;
        }

      private:
        bool used{false};
    };
} // namespace

class LFLogger::Members
{
    friend class LFLogger;

  public:
    ~Members();

  private:
    Members();
    Members(Members const&) = delete;

    std::shared_ptr<Pipeline> p_discard;
    std::shared_ptr<Pipeline> p_real_stdout;
    std::shared_ptr<Pipeline> p_stdout;
    std::shared_ptr<Pipeline> p_stderr;
    std::shared_ptr<Pipeline> p_info;
    std::shared_ptr<Pipeline> p_warn;
    std::shared_ptr<Pipeline> p_error;
    std::shared_ptr<Pipeline> p_save;
};

LFLogger::Members::Members() :
    p_discard(std::make_shared<Pl_Discard>()),
    p_real_stdout(std::make_shared<Pl_OStream>("standard output", std::cout)),
    p_stdout(std::make_shared<Pl_Track>("track stdout", p_real_stdout.get())),
    p_stderr(std::make_shared<Pl_OStream>("standard error", std::cerr)),
    p_info(p_stdout),
    p_warn(nullptr),
    p_error(p_stderr),
    p_save(nullptr)
{
}

LFLogger::Members::~Members()
{
    p_stdout->finish();
    p_stderr->finish();
}

LFLogger::LFLogger() :
    m(new Members())
{
}

std::shared_ptr<LFLogger>
LFLogger::create()
{
    return std::shared_ptr<LFLogger>(new LFLogger);
}

std::shared_ptr<LFLogger>
LFLogger::defaultLogger()
{
    static auto l = create();
    return l;
}

void
LFLogger::info(char const* s)
{
    getInfo(false)->writeCStr(s);
}

void
LFLogger::info(std::string const& s)
{
    getInfo(false)->writeString(s);
}

std::shared_ptr<Pipeline>
LFLogger::getInfo(bool null_okay)
{
    return throwIfNull(m->p_info, null_okay);
}

void
LFLogger::warn(char const* s)
{
    getWarn(false)->writeCStr(s);
}

void
LFLogger::warn(std::string const& s)
{
    getWarn(false)->writeString(s);
}

std::shared_ptr<Pipeline>
LFLogger::getWarn(bool null_okay)
{
    if (m->p_warn) {
        return m->p_warn;
    }
    return getError(null_okay);
}

void
LFLogger::error(char const* s)
{
    getError(false)->writeCStr(s);
}

void
LFLogger::error(std::string const& s)
{
    getError(false)->writeString(s);
}

std::shared_ptr<Pipeline>
LFLogger::getError(bool null_okay)
{
    return throwIfNull(m->p_error, null_okay);
}

std::shared_ptr<Pipeline>
LFLogger::getSave(bool null_okay)
{
    return throwIfNull(m->p_save, null_okay);
}

std::shared_ptr<Pipeline>
LFLogger::standardOutput()
{
    return m->p_stdout;
}

std::shared_ptr<Pipeline>
LFLogger::standardError()
{
    return m->p_stderr;
}

std::shared_ptr<Pipeline>
LFLogger::discard()
{
    return m->p_discard;
}

void
LFLogger::setInfo(std::shared_ptr<Pipeline> p)
{
    if (p == nullptr) {
        if (m->p_save == m->p_stdout) {
            p = m->p_stderr;
        } else {
            p = m->p_stdout;
        }
    }
    m->p_info = p;
}

void
LFLogger::setWarn(std::shared_ptr<Pipeline> p)
{
    m->p_warn = p;
}

void
LFLogger::setError(std::shared_ptr<Pipeline> p)
{
    if (p == nullptr) {
        p = m->p_stderr;
    }
    m->p_error = p;
}

void
LFLogger::setSave(std::shared_ptr<Pipeline> p, bool only_if_not_set)
{
    if (only_if_not_set && (m->p_save != nullptr)) {
        return;
    }
    if (m->p_save == p) {
        return;
    }
    if (p == m->p_stdout) {
        auto pt = dynamic_cast<Pl_Track*>(p.get());
        if (pt->getUsed()) {
            throw std::logic_error("LFLogger: called setSave on standard output after standard"
                                   " output has already been used");
        }
        if (m->p_info == m->p_stdout) {
            m->p_info = m->p_stderr;
        }
        LFUtil::binary_stdout();
    }
    m->p_save = p;
}

void
LFLogger::saveToStandardOutput(bool only_if_not_set)
{
    setSave(standardOutput(), only_if_not_set);
}

std::shared_ptr<Pipeline>
LFLogger::throwIfNull(std::shared_ptr<Pipeline> p, bool null_okay)
{
    if (!(null_okay || p)) {
        throw std::logic_error("LFLogger: requested a null pipeline without null_okay == true");
    }
    return p;
}
