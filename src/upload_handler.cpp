#include "updown/handlers.hpp"

#include "updown/logging.hpp"
#include "updown/paths.hpp"
#include "updown/text.hpp"

#include <fstream>
#include <utility>

namespace updown {

namespace {

const char* const UPLOAD_FIELD = "file";

// Walks the parts of one multipart body until the first "file" part has been
// written out. The open file is closed by the destructor on early exits.
class UploadReceiver {
public:
    enum class State {
        searching,
        writing,
        done,
        bad_name,
        io_error
    };

    explicit UploadReceiver(fs::path output_dir) : output_dir_(std::move(output_dir)) {}

    bool on_part(const httplib::MultipartFormData& part) {
        if (state_ == State::writing) {
            finish();
            return false;
        }
        if (state_ != State::searching) return false;
        if (part.name != UPLOAD_FIELD) return true;

        std::string name = upload_base_name(part.filename);
        if (name.empty() || name == "." || name == "..") {
            logging::error("rejected upload file name " + sanitize_for_log(part.filename));
            state_ = State::bad_name;
            return false;
        }

        target_ = output_dir_ / fs::u8path(name);
        logging::info("Receive upload of file name " + sanitize_for_log(part.filename)
            + ". Writing to " + sanitize_for_log(target_.u8string()) + ".");

        out_.open(target_, std::ios::binary | std::ios::trunc);
        if (!out_) {
            logging::error("unable to create " + sanitize_for_log(target_.u8string()));
            state_ = State::io_error;
            return false;
        }
        state_ = State::writing;
        return true;
    }

    bool on_data(const char* data, std::size_t len) {
        if (state_ != State::writing) return true;
        out_.write(data, static_cast<std::streamsize>(len));
        if (!out_) {
            logging::error("write failed for " + sanitize_for_log(target_.u8string()));
            state_ = State::io_error;
            return false;
        }
        return true;
    }

    // Called once the body has been consumed; `complete` is false when the
    // reader stopped early or the framing was broken.
    void on_end(bool complete) {
        if (state_ != State::writing) return;
        if (complete) {
            finish();
        }
        else {
            logging::error("upload body ended inside part for " + sanitize_for_log(target_.u8string()));
            out_.close();
            state_ = State::searching;
        }
    }

    State state() const { return state_; }

private:
    void finish() {
        out_.close();
        if (!out_) {
            logging::error("unable to close " + sanitize_for_log(target_.u8string()));
            state_ = State::io_error;
            return;
        }
        state_ = State::done;
    }

    fs::path output_dir_;
    fs::path target_;
    std::ofstream out_;
    State state_ = State::searching;
};

}  // namespace

// File Upload Handler
void upload_handler(const Directories& dirs, const httplib::Request& req, httplib::Response& res,
    const httplib::ContentReader& content_reader) {
    if (!req.is_multipart_form_data()) {
        logging::error("Unable to read multipart form data: content type "
            + sanitize_for_log(req.get_header_value("Content-Type")));
        res.status = 400;
        res.set_header("Connection", "close");
        return;
    }

    UploadReceiver receiver(dirs.output_dir);
    bool complete = content_reader(
        [&](const httplib::MultipartFormData& part) { return receiver.on_part(part); },
        [&](const char* data, std::size_t len) { return receiver.on_data(data, len); });
    receiver.on_end(complete);

    // Unread body bytes would be taken for the next request on this connection
    if (!complete) res.set_header("Connection", "close");

    // The runtime already answered 413 for a body above the payload limit
    if (!complete && res.status == 413) {
        logging::error("upload body exceeds the payload limit");
        return;
    }

    switch (receiver.state()) {
    case UploadReceiver::State::done:
        res.set_redirect("/", 302);
        return;
    case UploadReceiver::State::io_error:
        res.status = 500;
        break;
    case UploadReceiver::State::bad_name:
        res.status = 400;
        break;
    case UploadReceiver::State::searching:
    case UploadReceiver::State::writing:
        logging::error("no \"file\" part in upload");
        res.status = 400;
        break;
    }
}

}  // namespace updown
