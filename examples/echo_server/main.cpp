/// Echo server: minimal JSON-RPC 2.0 server over HTTP.
/// Usage: ./echo_server [port]
/// Try: curl -d '{"jsonrpc":"2.0","method":"Echo","params":{"foo":"bar"},"id":1}' localhost:8080/rpc

#include <lrpc/lrpc.hpp>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    auto mux = std::make_shared<lrpc::ServeMux>();

    mux->handle_func("Echo", [](lrpc::Call& call) -> lrpc::Result {
        nlohmann::json in;
        if (auto err = call.unmarshal_args(in)) return *err;
        return in;
    }).handle_func("Sum", [](lrpc::Call& call) -> lrpc::Result {
        std::vector<double> nums;
        if (auto err = call.unmarshal_args(nums)) {
            return lrpc::Failure(lrpc::json2::Error(lrpc::json2::ErrCode::InvalidParams,
                                                    "Sum expects an array of numbers"));
        }
        double total = 0;
        for (double n : nums) total += n;
        return total;
    });

    lrpc::http::HttpServer::Options opts;
    opts.host = "0.0.0.0";
    if (argc > 1) opts.port = static_cast<uint16_t>(std::stoi(argv[1]));
    opts.request_timeout = std::chrono::seconds(30);
    opts.on_error = [](std::exception_ptr e) {
        try {
            std::rethrow_exception(e);
        } catch (const std::exception& ex) {
            std::cerr << "request failed: " << ex.what() << "\n";
        }
    };

    lrpc::http::HttpServer server(opts, std::make_shared<lrpc::json2::Codec>(), mux);

    try {
        std::cout << "Listening on " << opts.host << ":" << opts.port << opts.path << "\n";
        // Blocks until shutdown
        server.listen();
    } catch (const lrpc::TransportError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
