/**
 * Copyright (c) 2017 Melown Technologies SE
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * *  Redistributions of source code must retain the above copyright notice,
 *    this list of conditions and the following disclaimer.
 *
 * *  Redistributions in binary form must reproduce the above copyright
 *    notice, this list of conditions and the following disclaimer in the
 *    documentation and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 * IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
 * ARE DISCLAIMED.  IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
 * LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 * CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 * SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 * INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 * CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 * ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 * POSSIBILITY OF SUCH DAMAGE.
 */

#ifndef rasterconf_lazy_hpp_included_
#define rasterconf_lazy_hpp_included_

#include <memory>
#include <mutex>

#include <boost/noncopyable.hpp>

/** Set-once slot for lazily created shared object.
 *
 *  Value is created at most once successfully; failed creation (exception)
 *  leaves the slot empty and next get() tries again. Once set, the value is
 *  never replaced.
 */
template <typename T>
class Lazy : boost::noncopyable {
public:
    typedef std::shared_ptr<T> pointer;

    Lazy() {}

    /** Returns stored value; creates it by calling create() first if not
     *  set yet.
     */
    template <typename Create> pointer get(Create create);

private:
    std::mutex mutex_;
    pointer value_;
};

// inlines

template <typename T>
template <typename Create>
typename Lazy<T>::pointer Lazy<T>::get(Create create)
{
    std::unique_lock<std::mutex> lock(mutex_);
    if (!value_) { value_ = create(); }
    return value_;
}

#endif // rasterconf_lazy_hpp_included_
