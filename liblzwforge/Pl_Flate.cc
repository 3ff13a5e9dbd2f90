#include <lzwforge/Pl_Flate.hh>

#include <lzwforge/LFIntC.hh>
#include <lzwforge/LFTC.hh>

#include <stdexcept>
#include <string>
#include <zlib.h>

int Pl_Flate::compression_level = Z_DEFAULT_COMPRESSION;

namespace
{
    char const*
    zlib_error_string(int error_code)
    {
        switch (error_code) {
        case Z_ERRNO:
            return "zlib system error";
        case Z_STREAM_ERROR:
            return "zlib stream error";
        case Z_DATA_ERROR:
            return "zlib data error";
        case Z_MEM_ERROR:
            return "zlib memory error";
        case Z_BUF_ERROR:
            return "zlib buffer error";
        case Z_VERSION_ERROR:
            return "zlib version error";
        default:
            return "zlib unknown error";
        }
    }
} // namespace

class Pl_Flate::Members
{
    friend class Pl_Flate;

  public:
    Members(size_t out_bufsize, action_e action) :
        outbuf(new unsigned char[out_bufsize]),
        out_bufsize(out_bufsize),
        action(action)
    {
        zstream.zalloc = nullptr;
        zstream.zfree = nullptr;
        zstream.opaque = nullptr;
        zstream.next_in = nullptr;
        zstream.avail_in = 0;
        zstream.msg = nullptr;
        zstream.next_out = outbuf.get();
        zstream.avail_out = LFIntC::to_uint(out_bufsize);
    }
    Members(Members const&) = delete;
    ~Members()
    {
        if (initialized) {
            if (action == a_deflate) {
                deflateEnd(&zstream);
            } else {
                inflateEnd(&zstream);
            }
        }
    }

  private:
    z_stream zstream;
    std::unique_ptr<unsigned char[]> outbuf;
    size_t out_bufsize;
    action_e action;
    bool initialized{false};
    bool finished{false};
    std::function<void(char const*, int)> callback;
};

Pl_Flate::Pl_Flate(
    char const* identifier, Pipeline* next, action_e action, unsigned int out_bufsize) :
    Pipeline(identifier, next),
    m(std::make_unique<Members>(LFIntC::to_size(out_bufsize), action))
{
    if (!next) {
        throw std::logic_error("Attempt to create Pl_Flate with nullptr as next");
    }
}

Pl_Flate::~Pl_Flate() = default;

void
Pl_Flate::setWarnCallback(std::function<void(char const*, int)> callback)
{
    m->callback = callback;
}

void
Pl_Flate::setCompressionLevel(int level)
{
    compression_level = level;
}

void
Pl_Flate::write(unsigned char const* data, size_t len)
{
    if (m->finished) {
        throw std::logic_error(this->identifier + ": Pl_Flate: write() called after finish()");
    }
    // zlib counts input in unsigned ints, so feed it in pieces.
    static size_t const max_bytes = 1 << 30;
    int flush = (m->action == a_inflate) ? Z_SYNC_FLUSH : Z_NO_FLUSH;
    while (len > 0) {
        size_t bytes = (len > max_bytes) ? max_bytes : len;
        handleData(data, bytes, flush);
        data += bytes;
        len -= bytes;
    }
}

void
Pl_Flate::initialize()
{
    int err = Z_OK;
    // deflateInit and inflateInit are macros that use old-style casts.
#if ((defined(__GNUC__) && ((__GNUC__ * 100) + __GNUC_MINOR__) >= 406) || defined(__clang__))
# pragma GCC diagnostic push
# pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
    if (m->action == a_deflate) {
        err = deflateInit(&m->zstream, compression_level);
    } else {
        err = inflateInit(&m->zstream);
    }
#if ((defined(__GNUC__) && ((__GNUC__ * 100) + __GNUC_MINOR__) >= 406) || defined(__clang__))
# pragma GCC diagnostic pop
#endif
    checkError("Init", err);
    m->initialized = true;
}

void
Pl_Flate::writeOutput()
{
    auto& zstream = m->zstream;
    size_t ready = m->out_bufsize - zstream.avail_out;
    if (ready > 0) {
        next()->write(m->outbuf.get(), ready);
        zstream.next_out = m->outbuf.get();
        zstream.avail_out = LFIntC::to_uint(m->out_bufsize);
    }
}

void
Pl_Flate::handleData(unsigned char const* data, size_t len, int flush)
{
    if (!m->initialized) {
        initialize();
    }
    auto& zstream = m->zstream;
    // zlib does not modify the input but only declares next_in const when built with ZLIB_CONST.
    zstream.next_in = const_cast<unsigned char*>(data);
    zstream.avail_in = LFIntC::to_uint(len);

    while (true) {
        int err = (m->action == a_deflate) ? deflate(&zstream, flush) : inflate(&zstream, flush);
        if (err == Z_BUF_ERROR) {
            // No progress was possible; for inflate at the end of input this means the stream was
            // truncated.
            LFTC::TC("lzwforge", "Pl_Flate buffer error");
            if (m->callback) {
                m->callback("input stream is complete but output may still be valid", err);
            }
            return;
        }
        if ((err != Z_OK) && (err != Z_STREAM_END)) {
            checkError("data", err);
        }
        bool drained = (zstream.avail_in == 0) && (zstream.avail_out > 0);
        writeOutput();
        if ((err == Z_STREAM_END) || drained) {
            return;
        }
    }
}

void
Pl_Flate::finish()
{
    if (!m->finished) {
        m->finished = true;
        // Deflating nothing still produces a valid, empty zlib stream.
        if (m->initialized || (m->action == a_deflate)) {
            handleData(nullptr, 0, Z_FINISH);
            int err = (m->action == a_deflate) ? deflateEnd(&m->zstream) : inflateEnd(&m->zstream);
            m->initialized = false;
            checkError("End", err);
        }
    }
    next()->finish();
}

void
Pl_Flate::checkError(char const* prefix, int error_code)
{
    if (error_code == Z_OK) {
        return;
    }
    std::string msg = this->identifier + ": " +
        ((m->action == a_deflate) ? "deflate" : "inflate") + ": " + prefix + ": ";
    if (m->zstream.msg) {
        msg += m->zstream.msg;
    } else {
        msg += zlib_error_string(error_code);
        msg += " (" + std::to_string(error_code) + ")";
    }
    throw std::runtime_error(msg);
}
