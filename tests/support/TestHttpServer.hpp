#ifndef TESTHTTPSERVER_HPP
#define TESTHTTPSERVER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// How the server answers one request
struct ScriptedResponse
{
    int status{0};                  // 0 serves the body, honouring Range when allowed
    bool honourRange{true};
    uint64_t disconnectAfter{0};    // Close after this many body bytes; 0 sends everything
    std::chrono::milliseconds pieceDelay{0};
    size_t pieceSize{4096};
    bool rangeFromStart{false};     // Answer a range request with 206 for the whole body
    uint64_t announcedTotal{0};     // Complete length claimed by Content-Range; 0 uses the body size
};

struct RecordedRequest
{
    std::string method;
    std::string target;
    std::map<std::string, std::string> headers; // Lower-case names
};

// Single-threaded HTTP/1.1 server on 127.0.0.1 serving one body with byte-range support
class TestHttpServer
{
public:
    explicit TestHttpServer(std::string body);
    ~TestHttpServer();

    TestHttpServer(const TestHttpServer &) = delete;
    TestHttpServer &operator=(const TestHttpServer &) = delete;

    std::string url(const std::string &target = "/episode.mp3") const;
    uint16_t port() const { return _port; }

    // Responses consumed by successive requests; afterwards defaultResponse applies.
    // With a target, the response is only used for requests to that target.
    void enqueue(ScriptedResponse response, const std::string &target = "");
    void setDefaultResponse(ScriptedResponse response);

    std::vector<RecordedRequest> requests() const;

    const std::string &body() const { return _body; }

    // A port on which nothing is listening
    static uint16_t unusedPort();

private:
    void serve();
    void handle(int client);
    ScriptedResponse nextResponse(const std::string &target);

    std::string _body;
    int _listenFd{-1};
    uint16_t _port{0};
    std::atomic<bool> _stop{false};
    std::thread _thread;

    mutable std::mutex _mutex;
    std::deque<ScriptedResponse> _script;
    std::map<std::string, std::deque<ScriptedResponse>> _targetScripts;
    ScriptedResponse _default;
    std::vector<RecordedRequest> _requests;
};

#endif
