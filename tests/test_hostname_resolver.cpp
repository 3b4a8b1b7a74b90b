#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <chrono>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include "../scanner/HostnameResolver.hpp"

using netwatch::scanner::DnsReverseResolver;
using netwatch::scanner::ShortHostname;

static void AppendLabels(std::vector<uint8_t> &buf, const std::vector<std::string> &labels)
{
    for (const auto &label : labels)
    {
        buf.push_back(static_cast<uint8_t>(label.size()));
        buf.insert(buf.end(), label.begin(), label.end());
    }
    buf.push_back(0);
}

static std::vector<uint8_t> PtrReply(const std::vector<uint8_t> &query, const std::vector<std::string> &labels)
{
    std::vector<uint8_t> reply = query;
    reply[2] = 0x81;
    reply[3] = 0x80;
    reply[7] = 0x01;
    reply.insert(reply.end(), {0xC0, 0x0C, 0x00, 0x0C, 0x00, 0x01, 0x00, 0x00, 0x0E, 0x10});
    std::vector<uint8_t> rdata;
    AppendLabels(rdata, labels);
    reply.push_back(0x00);
    reply.push_back(static_cast<uint8_t>(rdata.size()));
    reply.insert(reply.end(), rdata.begin(), rdata.end());
    return reply;
}

static int BindLoopback(uint16_t &port_out)
{
    int fd = socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0)
        return -1;
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    socklen_t len = sizeof(addr);
    if (bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0 ||
        getsockname(fd, reinterpret_cast<sockaddr *>(&addr), &len) != 0)
    {
        close(fd);
        return -1;
    }
    port_out = ntohs(addr.sin_port);
    return fd;
}

// A local nameserver answers after a stranger has already sent a well formed reply with the
// right id. Only the nameserver's answer may be accepted.
static int CheckRepliesOnlyFromNameserver()
{
    uint16_t server_port = 0, stranger_port = 0;
    int server = BindLoopback(server_port);
    int stranger = BindLoopback(stranger_port);
    if (server < 0 || stranger < 0)
        return 20;

    struct timeval tv{5, 0};
    setsockopt(server, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    std::thread nameserver([server, stranger]()
                           {
        std::vector<uint8_t> query(512);
        sockaddr_in client{};
        socklen_t len = sizeof(client);
        ssize_t n = recvfrom(server, query.data(), query.size(), 0, reinterpret_cast<sockaddr *>(&client), &len);
        if (n < 12)
            return;
        query.resize(static_cast<size_t>(n));

        auto forged = PtrReply(query, {"intruder", "evil"});
        sendto(stranger, forged.data(), forged.size(), 0, reinterpret_cast<sockaddr *>(&client), len);
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        auto genuine = PtrReply(query, {"nas", "home", "lan"});
        sendto(server, genuine.data(), genuine.size(), 0, reinterpret_cast<sockaddr *>(&client), len); });

    DnsReverseResolver resolver("127.0.0.1", std::chrono::milliseconds(2000), server_port);
    auto name = resolver.Resolve("192.168.1.10");

    nameserver.join();
    close(server);
    close(stranger);

    if (name != std::optional<std::string>("nas"))
        return 21;
    return 0;
}

int main()
{
    auto query = DnsReverseResolver::BuildPtrQuery(0x1234, "192.168.1.10");
    if (query.size() < 12 || query[0] != 0x12 || query[1] != 0x34) return 1;
    std::string qname(query.begin() + 12, query.end());
    if (qname.find("10") == std::string::npos || qname.find("in-addr") == std::string::npos) return 2;

    // reply: the query echoed back plus one PTR answer whose owner name is a pointer to the question
    std::vector<uint8_t> reply = query;
    reply[2] = 0x81;
    reply[3] = 0x80;
    reply[7] = 0x01; // ANCOUNT
    reply.insert(reply.end(), {0xC0, 0x0C, 0x00, 0x0C, 0x00, 0x01, 0x00, 0x00, 0x0E, 0x10});
    std::vector<uint8_t> rdata;
    AppendLabels(rdata, {"nas", "home", "lan"});
    reply.push_back(0x00);
    reply.push_back(static_cast<uint8_t>(rdata.size()));
    reply.insert(reply.end(), rdata.begin(), rdata.end());

    auto name = DnsReverseResolver::ParsePtrAnswer(reply, 0x1234);
    if (name != std::optional<std::string>("nas.home.lan")) return 3;
    if (DnsReverseResolver::ParsePtrAnswer(reply, 0x4321).has_value()) return 4;

    std::vector<uint8_t> nxdomain = query;
    nxdomain[2] = 0x81;
    nxdomain[3] = 0x83;
    if (DnsReverseResolver::ParsePtrAnswer(nxdomain, 0x1234).has_value()) return 5;

    std::vector<uint8_t> truncated(reply.begin(), reply.end() - 4);
    if (DnsReverseResolver::ParsePtrAnswer(truncated, 0x1234).has_value()) return 6;

    if (ShortHostname("nas.home.lan.") != "nas") return 7;
    if (ShortHostname("printer") != "printer") return 8;
    if (ShortHostname("10.1.2.3") != "10.1.2.3") return 9;

    {
        std::ofstream conf("/tmp/netwatch_resolv.conf");
        conf << "# generated\nsearch home.lan\nnameserver 192.168.1.1\nnameserver 1.1.1.1\n";
    }
    if (DnsReverseResolver::SystemNameserver("/tmp/netwatch_resolv.conf") != "192.168.1.1") return 10;
    if (DnsReverseResolver::SystemNameserver("/nonexistent/resolv.conf") != "127.0.0.53") return 11;

    if (int rc = CheckRepliesOnlyFromNameserver(); rc != 0) return rc;
    return 0;
}
