#ifndef MICA_DETAIL_DEFER_HH
#define MICA_DETAIL_DEFER_HH

#include <mica/utils.hh>

namespace mica::detail {
template <typename Callable>
struct Deferred {
    Callable cb;
    ~Deferred() { cb(); }

    explicit Deferred(Callable&& _cb)
        : cb(std::forward<Callable>(_cb)) {}
};

struct DeferTag {
    template <typename Callable>
    Deferred<Callable> operator->*(Callable&& cb) {
        return Deferred<Callable>{std::forward<Callable>(cb)};
    }
};
} // namespace mica::detail

/// Run a block when the enclosing scope exits.
#define defer auto MICA_CAT(_mica_defer_, __COUNTER__) = ::mica::detail::DeferTag{}->*[&]

#endif // MICA_DETAIL_DEFER_HH
