#include "prsync/errors.hpp"
#include "prsync/remote_spec.hpp"

#include <cassert>
#include <string>

namespace {

bool rejects(const std::string &arg) {
    try {
        prsync::parse_remote_spec(arg);
    } catch (const prsync::ConfigurationError &) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    auto full = prsync::parse_remote_spec("alice@dtn.example.org:/data/run1");
    assert(full.user == "alice");
    assert(full.host == "dtn.example.org");
    assert(full.path == "/data/run1");
    assert(full.to_string() == "alice@dtn.example.org:/data/run1");
    assert(full.to_string("dtn7") == "alice@dtn7:/data/run1");
    assert(full.login() == "alice@dtn.example.org");

    auto bare = prsync::parse_remote_spec("node:/scratch/");
    assert(bare.user.empty());
    assert(bare.host == "node");
    assert(bare.path == "/scratch/");

    auto home = prsync::parse_remote_spec("node:");
    assert(home.host == "node" && home.path.empty());

    auto loopback = prsync::parse_remote_spec("[::1]:/path");
    assert(loopback.user.empty());
    assert(loopback.host == "[::1]");
    assert(loopback.path == "/path");
    assert(loopback.to_string() == "[::1]:/path");

    auto link_local = prsync::parse_remote_spec("user@[fe80::1%eth0]:/p");
    assert(link_local.user == "user");
    assert(link_local.host == "[fe80::1%eth0]");
    assert(link_local.path == "/p");

    assert(prsync::looks_remote("[2001:db8::7]:rel"));
    assert(!prsync::looks_remote("[::1]"));
    assert(!prsync::looks_remote("[::1/path"));
    assert(prsync::looks_remote("host:/x"));
    assert(prsync::looks_remote("u@host:rel/path"));
    assert(!prsync::looks_remote("/local/path"));
    assert(!prsync::looks_remote("./odd:name"));
    assert(!prsync::looks_remote(":nohost"));
    assert(!prsync::looks_remote("relative/dir"));

    assert(rejects("/local/path"));
    assert(rejects("@host:/p"));
    assert(rejects("bad host:/p"));
    assert(rejects("host::module/path"));
    assert(rejects("[::1]::module"));
    assert(rejects("[]:/p"));
    assert(rejects("[bad host]:/p"));
    assert(rejects("node]:/p"));

    assert(prsync::mapped_host("node", std::nullopt, 5) == "node");
    assert(prsync::mapped_host("node", 3, 0) == "node3");
    assert(prsync::mapped_host("node", 3, 2) == "node5");
    return 0;
}
