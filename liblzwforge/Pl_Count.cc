#include <lzwforge/Pl_Count.hh>

#include <lzwforge/LFIntC.hh>

#include <stdexcept>

class Pl_Count::Members
{
  public:
    Members() = default;
    Members(Members const&) = delete;
    ~Members() = default;

    // Must be lzwforge_offset_t, not size_t, to handle writing more than size_t can handle.
    lzwforge_offset_t count{0};
};

Pl_Count::Pl_Count(char const* identifier, Pipeline* next) :
    Pipeline(identifier, next),
    m(std::make_unique<Members>())
{
    if (!next) {
        throw std::logic_error("Attempt to create Pl_Count with nullptr as next");
    }
}

Pl_Count::~Pl_Count() = default;

void
Pl_Count::write(unsigned char const* buf, size_t len)
{
    if (len) {
        m->count += LFIntC::to_offset(len);
        next()->write(buf, len);
    }
}

void
Pl_Count::finish()
{
    next()->finish();
}

lzwforge_offset_t
Pl_Count::getCount() const
{
    return m->count;
}
