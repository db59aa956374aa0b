#include "GossipMessage.hpp"

#include <stdexcept>
#include <string>

namespace {

constexpr int kMagic   = 0x4E47;   // "NG"
constexpr int kVersion = 1;
constexpr int kMaxIdLength = 256;

void check(int rc, const char* what) {
    if (rc != MPI_SUCCESS) {
        throw std::runtime_error(std::string("gossip codec: ") + what + " failed");
    }
}

int packed_size(int count, MPI_Datatype type, MPI_Comm comm) {
    int n = 0;
    check(MPI_Pack_size(count, type, comm, &n), "MPI_Pack_size");
    return n;
}

class Packer {
public:
    Packer(std::vector<char>& buf, MPI_Comm comm) : buf_(buf), comm_(comm) {}

    void put(const void* data, int count, MPI_Datatype type) {
        check(MPI_Pack(data, count, type, buf_.data(), static_cast<int>(buf_.size()),
                       &pos_, comm_), "MPI_Pack");
    }
    void putString(const std::string& s) {
        int len = static_cast<int>(s.size());
        put(&len, 1, MPI_INT);
        if (len > 0) put(s.data(), len, MPI_CHAR);
    }
    int position() const { return pos_; }

private:
    std::vector<char>& buf_;
    MPI_Comm comm_;
    int pos_ = 0;
};

class Unpacker {
public:
    Unpacker(const std::vector<char>& buf, MPI_Comm comm) : buf_(buf), comm_(comm) {}

    void get(void* out, int count, MPI_Datatype type) {
        check(MPI_Unpack(buf_.data(), static_cast<int>(buf_.size()), &pos_,
                         out, count, type, comm_), "MPI_Unpack");
    }
    std::string getString() {
        int len = 0;
        get(&len, 1, MPI_INT);
        if (len < 0 || len > kMaxIdLength) {
            throw std::runtime_error("gossip codec: bad string length " + std::to_string(len));
        }
        std::string s(static_cast<std::size_t>(len), '\0');
        if (len > 0) get(&s[0], len, MPI_CHAR);
        return s;
    }

private:
    const std::vector<char>& buf_;
    MPI_Comm comm_;
    int pos_ = 0;
};

} // namespace

std::vector<char> encodeGossip(const GossipMessage& msg, MPI_Comm comm) {
    if (msg.node_id.size() > static_cast<std::size_t>(kMaxIdLength) ||
        msg.delta.origin.size() > static_cast<std::size_t>(kMaxIdLength)) {
        throw std::invalid_argument("encodeGossip: node id too long");
    }

    const int id_len     = static_cast<int>(msg.node_id.size());
    const int origin_len = static_cast<int>(msg.delta.origin.size());

    int size = 0;
    size += packed_size(5, MPI_INT, comm);                        // magic, version, state, 2 lengths
    size += packed_size(id_len + origin_len, MPI_CHAR, comm);
    size += packed_size(3 + static_cast<int>(kModelParams), MPI_DOUBLE, comm);
    size += packed_size(2, MPI_UINT32_T, comm);
    size += packed_size(1, MPI_UINT64_T, comm);

    std::vector<char> buf(static_cast<std::size_t>(size));
    Packer p(buf, comm);

    const int magic = kMagic, version = kVersion, state = stateCode(msg.state);
    p.put(&magic, 1, MPI_INT);
    p.put(&version, 1, MPI_INT);
    p.putString(msg.node_id);
    p.put(&state, 1, MPI_INT);
    p.put(&msg.residual_kw, 1, MPI_DOUBLE);
    p.put(&msg.timestamp_s, 1, MPI_DOUBLE);
    p.put(&msg.sequence, 1, MPI_UINT64_T);

    p.putString(msg.delta.origin);
    p.put(msg.delta.params.data(), static_cast<int>(kModelParams), MPI_DOUBLE);
    p.put(&msg.delta.sample_count, 1, MPI_UINT32_T);
    p.put(&msg.delta.staleness, 1, MPI_UINT32_T);
    p.put(&msg.delta.timestamp_s, 1, MPI_DOUBLE);

    buf.resize(static_cast<std::size_t>(p.position()));
    return buf;
}

GossipMessage decodeGossip(const std::vector<char>& buf, MPI_Comm comm) {
    // MPI_Unpack past the end is an MPI error, so reject short buffers here.
    if (buf.size() < static_cast<std::size_t>(packed_size(5, MPI_INT, comm))) {
        throw std::runtime_error("gossip codec: truncated buffer");
    }

    Unpacker u(buf, comm);
    int magic = 0, version = 0, state = 0;
    u.get(&magic, 1, MPI_INT);
    if (magic != kMagic) throw std::runtime_error("gossip codec: bad magic");
    u.get(&version, 1, MPI_INT);
    if (version != kVersion) {
        throw std::runtime_error("gossip codec: unsupported version " + std::to_string(version));
    }

    GossipMessage m;
    m.node_id = u.getString();
    u.get(&state, 1, MPI_INT);
    m.state = stateFromCode(state);   // throws std::invalid_argument
    u.get(&m.residual_kw, 1, MPI_DOUBLE);
    u.get(&m.timestamp_s, 1, MPI_DOUBLE);
    u.get(&m.sequence, 1, MPI_UINT64_T);

    m.delta.origin = u.getString();
    u.get(m.delta.params.data(), static_cast<int>(kModelParams), MPI_DOUBLE);
    u.get(&m.delta.sample_count, 1, MPI_UINT32_T);
    u.get(&m.delta.staleness, 1, MPI_UINT32_T);
    u.get(&m.delta.timestamp_s, 1, MPI_DOUBLE);

    if (m.delta.origin != m.node_id) {
        throw std::runtime_error("gossip codec: delta origin does not match sender");
    }
    return m;
}
