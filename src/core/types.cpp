#include "core/types.hpp"

namespace sketchsync {

static_assert(sizeof(Uuid) == 16, "Uuid should be 16 bytes");
static_assert(std::is_trivially_copyable_v<Uuid>, "Uuid should be trivially copyable");
static_assert(std::is_trivially_copyable_v<Timestamp>, "Timestamp should be trivially copyable");

std::string generate_element_id() {
    static constexpr char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    static constexpr size_t kLength = 13;

    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    std::uniform_int_distribution<size_t> dist(0, sizeof(kAlphabet) - 2);

    std::string id;
    id.reserve(kLength);
    for (size_t i = 0; i < kLength; ++i) {
        id += kAlphabet[dist(gen)];
    }
    return id;
}

ActorId make_history_actor(const ActorId& user) {
    return user + ":" + Uuid::generate().to_string().substr(0, 8);
}

} // namespace sketchsync
