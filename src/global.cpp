/**
* @file
* @brief Process-wide client registry and the helpers behind the STATSD_* macros.
*
* @details The registry is a function-local static (constructed on first use,
* thread-safe per C++11). The client pointer is read with the shared_ptr atomic
* free functions so a concurrent @ref statsd::global::reinit cannot free a
* client another thread is still recording into.
*/

#include "statsd/global.hpp"
#include "statsd/errors.hpp"
#include <atomic>
#include <mutex>

namespace statsd {
namespace global {

namespace {

struct Registry {
    std::mutex              init_mu;
    std::shared_ptr<Client> client;
};

Registry& registry() {
    static Registry r;
    return r;
}

const Sampler& site_sampler() {
    static const Sampler s;
    return s;
}

} // namespace

namespace detail {

bool should_sample(const SampleRate& rate, SampleChannel& ch) {
    return site_sampler().should_sample(rate, ch);
}

bool deliver(const Observation& obs) {
    std::shared_ptr<Client> c = instance();
    if (!c) return false;
    try {
        c->record(obs);
    } catch (const Error&) {
        // Counted by the client (encode_errors / send_errors).
        return false;
    }
    return true;
}

} // namespace detail

bool init(const ClientConfig& cfg) {
    Registry& r = registry();
    std::lock_guard<std::mutex> lg(r.init_mu);
    if (std::atomic_load(&r.client)) return false;
    std::atomic_store(&r.client, std::make_shared<Client>(cfg));
    return true;
}

void reinit(std::shared_ptr<Client> client) {
    Registry& r = registry();
    std::lock_guard<std::mutex> lg(r.init_mu);
    std::atomic_store(&r.client, std::move(client));
}

std::shared_ptr<Client> instance() {
    return std::atomic_load(&registry().client);
}

bool shutdown() {
    Registry& r = registry();
    std::shared_ptr<Client> old;
    {
        std::lock_guard<std::mutex> lg(r.init_mu);
        old = std::atomic_exchange(&r.client, std::shared_ptr<Client>());
    }
    if (!old) return false;
    try {
        old->flush();
    } catch (const SendError&) {
        return false;
    }
    return true;
}

bool count(std::string_view name, int64_t value, const SampleRate& rate) {
    if (!site_sampler().should_sample(rate)) return true;
    return detail::deliver(Observation{name, MetricKind::Counter, value, false, rate});
}

bool count(std::string_view name, int64_t value, const SampleRate& rate, SampleChannel& ch) {
    if (!site_sampler().should_sample(rate, ch)) return true;
    return detail::deliver(Observation{name, MetricKind::Counter, value, false, rate});
}

bool timing(std::string_view name, int64_t millis, const SampleRate& rate) {
    if (!site_sampler().should_sample(rate)) return true;
    return detail::deliver(Observation{name, MetricKind::Timer, millis, false, rate});
}

bool timing(std::string_view name, int64_t millis, const SampleRate& rate, SampleChannel& ch) {
    if (!site_sampler().should_sample(rate, ch)) return true;
    return detail::deliver(Observation{name, MetricKind::Timer, millis, false, rate});
}

bool gauge(std::string_view name, Gauge g, const SampleRate& rate) {
    if (!site_sampler().should_sample(rate)) return true;
    return detail::deliver(Observation{name, MetricKind::Gauge, g.value, g.delta, rate});
}

bool gauge(std::string_view name, Gauge g, const SampleRate& rate, SampleChannel& ch) {
    if (!site_sampler().should_sample(rate, ch)) return true;
    return detail::deliver(Observation{name, MetricKind::Gauge, g.value, g.delta, rate});
}

bool set(std::string_view name, int64_t value, const SampleRate& rate) {
    if (!site_sampler().should_sample(rate)) return true;
    return detail::deliver(Observation{name, MetricKind::Set, value, false, rate});
}

bool set(std::string_view name, int64_t value, const SampleRate& rate, SampleChannel& ch) {
    if (!site_sampler().should_sample(rate, ch)) return true;
    return detail::deliver(Observation{name, MetricKind::Set, value, false, rate});
}

bool flush() {
    std::shared_ptr<Client> c = instance();
    if (!c) return false;
    try {
        c->flush();
    } catch (const SendError&) {
        return false;
    }
    return true;
}

} // namespace global
} // namespace statsd
