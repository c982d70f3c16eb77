#include <relay/http_front.hpp>
#include <relay/form.hpp>
#include <relay/static_content.hpp>

#include <stdexcept>
#include <utility>

#include <boost/beast/core.hpp>

namespace relay
{
    namespace beast = boost::beast;

    static Logger &logger = Logger::getInstance();

    namespace
    {
        constexpr std::string_view staticPrefix = "/static/";
        constexpr std::string_view messageEndpoint = "/message";

        /// Body size accepted for a form POST.
        constexpr std::uint64_t maxBodySize = 1024 * 1024;

        void set_common_headers(Response &res, unsigned version)
        {
            res.version(version);
            res.set(http::field::server, "relay");
            res.keep_alive(false);
        }

        Response make_response(http::status status,
                               unsigned version,
                               std::string_view contentType,
                               std::string body)
        {
            Response res{status, version};
            set_common_headers(res, version);
            res.set(http::field::content_type,
                    beast::string_view(contentType.data(), contentType.size()));
            res.body() = std::move(body);
            res.prepare_payload();
            return res;
        }

        /// Path part of a request target, without query string or fragment.
        std::string_view route_of(std::string_view target)
        {
            const auto cut = target.find_first_of("?#");
            if (cut != std::string_view::npos)
                target = target.substr(0, cut);
            return target;
        }
    } // namespace

    // ───────────────────────── RequestHandler ─────────────────────────

    RequestHandler::RequestHandler(std::string pagesRoot,
                                   std::string staticRoot,
                                   std::shared_ptr<IMessageSender> sender)
        : pagesRoot_(std::move(pagesRoot)),
          staticRoot_(std::move(staticRoot)),
          sender_(std::move(sender))
    {
        if (pagesRoot_.empty())
            pagesRoot_ = ".";
    }

    Response RequestHandler::handle(const Request &req) const
    {
        const std::string_view target(req.target().data(), req.target().size());
        const std::string_view path = route_of(target);

        Response res;
        switch (req.method())
        {
        case http::verb::get:
            res = handle_get(path, req.version());
            break;

        case http::verb::post:
            if (path == messageEndpoint)
                res = handle_message_post(req);
            else
                res = error_page(req.version());
            break;

        default:
            res = not_implemented(req.version());
            break;
        }

        logger.log(Logger::Level::INFO,
                   "[Relay][HttpFront] \"{} {}\" {}",
                   std::string(req.method_string().data(), req.method_string().size()),
                   std::string(target),
                   res.result_int());
        return res;
    }

    Response RequestHandler::handle_get(std::string_view path, unsigned version) const
    {
        if (path == "/" || path == "/index.html")
            return serve_page("index.html", version);

        if (path == "/message.html")
            return serve_page("message.html", version);

        if (path == "/error.html")
            return serve_page("error.html", version);

        if (path.compare(0, staticPrefix.size(), staticPrefix) == 0)
            return serve_static(path.substr(staticPrefix.size()), version);

        return error_page(version);
    }

    Response RequestHandler::handle_message_post(const Request &req) const
    {
        const FormFields fields = parse_form(req.body());

        Message msg;
        msg.username = form_value(fields, "username");
        msg.message = form_value(fields, "message");

        if (!msg.complete())
        {
            logger.log(Logger::Level::ERROR,
                       "[Relay][HttpFront] Missing required field 'username' or 'message'");
            return error_page(req.version());
        }

        try
        {
            if (!sender_)
                throw std::runtime_error("no message sender configured");

            sender_->send(msg);
            logger.log(Logger::Level::DEBUG,
                       "[Relay][HttpFront] Message from '{}' handed to the socket listener",
                       msg.username);
        }
        catch (const std::exception &e)
        {
            // the browser is redirected home either way
            logger.log(Logger::Level::ERROR,
                       "[Relay][HttpFront] Error sending message to the socket listener: {}", e.what());
        }

        return redirect_home(req.version());
    }

    Response RequestHandler::serve_page(const std::string &name, unsigned version) const
    {
        auto body = load_file(pagesRoot_ + "/" + name);
        if (!body)
            return error_page(version);

        return make_response(http::status::ok, version, "text/html", std::move(*body));
    }

    Response RequestHandler::serve_static(std::string_view relative, unsigned version) const
    {
        auto path = resolve_static_path(staticRoot_, relative);
        if (!path)
            return error_page(version);

        auto body = load_file(*path);
        if (!body)
            return error_page(version);

        return make_response(http::status::ok, version, mime_type(*path), std::move(*body));
    }

    Response RequestHandler::error_page(unsigned version, http::status status) const
    {
        auto body = load_file(pagesRoot_ + "/error.html");
        if (!body)
        {
            logger.log(Logger::Level::WARN,
                       "[Relay][HttpFront] error.html missing in {}, using plain text", pagesRoot_);

            std::string text = std::to_string(static_cast<unsigned>(status)) + " ";
            const auto reason = http::obsolete_reason(status);
            text.append(reason.data(), reason.size());
            text.push_back('\n');
            return make_response(status, version, "text/plain; charset=utf-8", std::move(text));
        }

        return make_response(status, version, "text/html", std::move(*body));
    }

    Response RequestHandler::payload_too_large(unsigned version) const
    {
        return error_page(version, http::status::payload_too_large);
    }

    Response RequestHandler::redirect_home(unsigned version) const
    {
        Response res{http::status::found, version};
        set_common_headers(res, version);
        res.set(http::field::location, "/");
        res.prepare_payload();
        return res;
    }

    Response RequestHandler::not_implemented(unsigned version) const
    {
        return make_response(http::status::not_implemented, version,
                             "text/plain; charset=utf-8", "Unsupported method\n");
    }

    // ───────────────────────── HttpFront ─────────────────────────

    HttpFront::HttpFront(const Config &cfg, std::shared_ptr<IMessageSender> sender)
        : handler_(nullptr),
          server_(nullptr)
    {
        if (!sender)
            sender = std::make_shared<SocketSender>(cfg.socketHost, cfg.socketPort);

        handler_ = std::make_shared<RequestHandler>(cfg.pagesRoot, cfg.staticRoot, std::move(sender));

        auto handler = handler_;
        server_ = std::make_unique<TcpServer>(
            "HttpFront",
            cfg.httpHost,
            cfg.httpPort,
            [handler](tcp::socket socket)
            {
                handle_session(std::move(socket), *handler);
            });
    }

    void HttpFront::run()
    {
        server_->run();
    }

    void HttpFront::stop()
    {
        server_->stop_async();
    }

    void HttpFront::handle_session(tcp::socket socket, const RequestHandler &handler)
    {
        boost::system::error_code ec;

        beast::flat_buffer buffer;
        http::request_parser<http::string_body> parser;
        parser.body_limit(maxBodySize);

        http::read(socket, buffer, parser, ec);

        if (ec == http::error::end_of_stream)
        {
            socket.close(ec);
            return;
        }

        if (ec == http::error::body_limit)
        {
            logger.log(Logger::Level::ERROR,
                       "[Relay][HttpFront] Request body exceeds {} bytes", maxBodySize);

            Response res = handler.payload_too_large(parser.get().version());
            http::write(socket, res, ec);
            if (ec)
            {
                logger.log(Logger::Level::WARN,
                           "[Relay][HttpFront] Write error: {}", ec.message());
            }

            boost::system::error_code ignore;
            socket.shutdown(tcp::socket::shutdown_send, ignore);
            socket.close(ignore);
            return;
        }

        if (ec)
        {
            logger.log(Logger::Level::WARN,
                       "[Relay][HttpFront] Read error: {}", ec.message());

            boost::system::error_code ignore;
            socket.shutdown(tcp::socket::shutdown_both, ignore);
            socket.close(ignore);
            return;
        }

        Response res = handler.handle(parser.get());

        http::write(socket, res, ec);
        if (ec)
        {
            logger.log(Logger::Level::WARN,
                       "[Relay][HttpFront] Write error: {}", ec.message());
        }

        boost::system::error_code ignore;
        socket.shutdown(tcp::socket::shutdown_send, ignore);
        socket.close(ignore);
    }

} // namespace relay
