#include "updown/method_router.hpp"

#include <utility>

namespace updown {

MethodRouter::MethodRouter(ByMethod handlers) : handlers_(std::move(handlers)) {}

void MethodRouter::dispatch(const httplib::Request& req, httplib::Response& res,
    const httplib::ContentReader* reader) const {
    if (req.method == "GET" || req.method == "HEAD") {
        if (handlers_.get) {
            handlers_.get(req, res);
            return;
        }
    }
    else if (req.method == "POST") {
        if (handlers_.post && reader) {
            handlers_.post(req, res, *reader);
            return;
        }
    }

    res.status = 405;
    // The body was never pulled, so the connection cannot be reused
    if (reader) res.set_header("Connection", "close");
}

void MethodRouter::mount(httplib::Server& svr, const std::string& pattern) const {
    const MethodRouter router = *this;

    svr.Get(pattern, [router](const httplib::Request& req, httplib::Response& res) {
        router.dispatch(req, res, nullptr);
    });
    // Body stays unread unless the POST handler pulls it
    svr.Post(pattern, [router](const httplib::Request& req, httplib::Response& res,
        const httplib::ContentReader& reader) {
        router.dispatch(req, res, &reader);
    });
    svr.Put(pattern, [router](const httplib::Request& req, httplib::Response& res,
        const httplib::ContentReader& reader) {
        router.dispatch(req, res, &reader);
    });
    svr.Patch(pattern, [router](const httplib::Request& req, httplib::Response& res,
        const httplib::ContentReader& reader) {
        router.dispatch(req, res, &reader);
    });
    svr.Delete(pattern, [router](const httplib::Request& req, httplib::Response& res) {
        router.dispatch(req, res, nullptr);
    });
    svr.Options(pattern, [router](const httplib::Request& req, httplib::Response& res) {
        router.dispatch(req, res, nullptr);
    });
}

}  // namespace updown
