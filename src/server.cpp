#include "updown/server.hpp"

#include "updown/logging.hpp"
#include "updown/method_router.hpp"

namespace updown {

void configure_server(httplib::Server& svr, const Directories& dirs, std::size_t max_upload_size) {
    svr.set_payload_max_length(max_upload_size);

    svr.set_pre_routing_handler([](const httplib::Request& req, httplib::Response&) {
        logging::request(req);
        return httplib::Server::HandlerResponse::Unhandled;
    });

    MethodRouter(ByMethod{
        [dirs](const httplib::Request& req, httplib::Response& res) { listing_handler(dirs, req, res); },
        nullptr }).mount(svr, "/");

    MethodRouter(ByMethod{
        nullptr,
        [dirs](const httplib::Request& req, httplib::Response& res, const httplib::ContentReader& reader) {
            upload_handler(dirs, req, res, reader);
        } }).mount(svr, "/upload");

    MethodRouter(ByMethod{
        [dirs](const httplib::Request& req, httplib::Response& res) { download_handler(dirs, req, res); },
        nullptr }).mount(svr, "/download");

    svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        logging::access(req, res);
    });
}

}  // namespace updown
