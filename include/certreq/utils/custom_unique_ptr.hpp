#pragma once
#include <memory>

namespace certreq::utils
{

template <typename T, void (*f)(T*)> struct static_function_deleter
{
    void operator()(T* t) const
    {
        f(t);
    }
};

} // namespace certreq::utils

#define CERTREQ_DEFINE_UNIQUE_PTR_WITH_DELETER(alias, object, deleter)         \
    struct alias : public std::unique_ptr<object, deleter>                     \
    {                                                                          \
        using unique_ptr::unique_ptr;                                          \
                                                                               \
        operator object*() const                                               \
        {                                                                      \
            return this->get();                                                \
        }                                                                      \
    }

#define CERTREQ_DEFINE_UNIQUE_PTR(alias, object, deleter)                      \
    using alias##Deleter =                                                     \
        certreq::utils::static_function_deleter<object, &deleter>;             \
    CERTREQ_DEFINE_UNIQUE_PTR_WITH_DELETER(alias, object, alias##Deleter)
