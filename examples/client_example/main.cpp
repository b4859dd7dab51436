/// Client example: calls a JSON-RPC 2.0 method over HTTP and prints the result.
/// Usage: ./client_example <url> <method> [params-json]
/// Example: ./client_example http://127.0.0.1:8080/rpc Sum '[1, 2, 3]'

#include <lrpc/lrpc.hpp>
#include <iostream>

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <url> <method> [params-json]\n";
        std::cerr << "Example: " << argv[0] << " http://127.0.0.1:8080/rpc Echo '{\"foo\":\"bar\"}'\n";
        return 1;
    }

    lrpc::json2::Client::Options opts;
    opts.base_url = argv[1];
    std::string method = argv[2];

    try {
        nlohmann::json params = argc > 3 ? nlohmann::json::parse(argv[3]) : nlohmann::json::object();
        lrpc::json2::Client client{std::move(opts)};
        auto result = client.call(method, params);
        std::cout << result.dump(2) << "\n";
    } catch (const lrpc::json2::Error& e) {
        std::cerr << "RPC error " << static_cast<int>(e.code()) << ": " << e.what() << "\n";
        if (e.data()) std::cerr << "  data: " << e.data()->dump() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
