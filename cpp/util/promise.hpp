#ifndef UTIL_PROMISE_HPP
#define UTIL_PROMISE_HPP

#include <string>

#include <kj/async.h>
#include <kj/debug.h>

namespace util {

// Adds context to the exception a promise may be rejected with.
template <typename T>
kj::Promise<T> WithContext(kj::Promise<T>&& promise, std::string context) {
  return promise.catch_([context = std::move(context)](
                            kj::Exception&& exception) -> kj::Promise<T> {
    exception.wrapContext(__FILE__, __LINE__,
                          kj::heapString(context.data(), context.size()));
    return kj::mv(exception);
  });
}

// Runs func, turning anything it throws into a rejection, and adds context to
// the rejection of the promise it returns.
template <typename Func>
kj::PromiseForResult<Func, void> Stage(std::string context, Func&& func) {
  return WithContext(kj::evalNow(kj::fwd<Func>(func)), std::move(context));
}

}  // namespace util

#endif
