#include "utils/tracing.h"
#include "utils/logger.h"

#include <regex>
#include <string>
#include <utility>

#include <boost/asio.hpp>

#ifdef TRIVIUM_ENABLE_TRACING
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/trace/simple_processor_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/sdk/resource/resource.h>

namespace otel_sdk = opentelemetry::sdk;
namespace otel_exporter = opentelemetry::exporter::otlp;
#endif

namespace trivium {

#ifdef TRIVIUM_ENABLE_TRACING
otel::nostd::shared_ptr<otel::trace::Tracer> Tracer::tracer_;
#endif
bool Tracer::initialized_ = false;

namespace {

// Collector-Erreichbarkeit prüfen, bevor der Exporter bei jedem Span Fehler loggt
bool collectorReachable(const std::string& endpoint) {
    static const std::regex re(R"((?:http|https)://([^/:]+)(?::(\d+))?)", std::regex::icase);
    std::smatch m;
    std::string host = endpoint;
    uint16_t port = 4318; // OTLP/HTTP default
    if (std::regex_search(endpoint, m, re)) {
        host = m[1].str();
        if (m[2].matched) port = static_cast<uint16_t>(std::stoi(m[2].str()));
    }

    namespace net = boost::asio;
    using tcp = net::ip::tcp;
    net::io_context io;
    boost::system::error_code ec;
    tcp::resolver resolver(io);
    auto results = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        TRIVIUM_WARN("Tracing collector resolve failed ({}:{}): {}", host, port, ec.message());
        return false;
    }
    tcp::socket socket(io);
    net::connect(socket, results, ec);
    if (ec) {
        TRIVIUM_WARN("Tracing collector unreachable ({}:{}): {}", host, port, ec.message());
        return false;
    }
    return true;
}

} // namespace

bool Tracer::initialize(const std::string& serviceName, const std::string& endpoint) {
    if (initialized_) {
        TRIVIUM_WARN("Tracer already initialized");
        return false;
    }
#ifdef TRIVIUM_ENABLE_TRACING
    try {
        if (!collectorReachable(endpoint)) {
            TRIVIUM_WARN("Tracing disabled, collector at {} not reachable", endpoint);
            return false;
        }

        otel_exporter::OtlpHttpExporterOptions opts;
        opts.url = endpoint + "/v1/traces";
        auto exporter = otel_exporter::OtlpHttpExporterFactory::Create(opts);
        auto processor = otel_sdk::trace::SimpleSpanProcessorFactory::Create(std::move(exporter));
        auto resource = otel_sdk::resource::Resource::Create({{"service.name", serviceName}});

        std::shared_ptr<otel::trace::TracerProvider> provider =
            otel_sdk::trace::TracerProviderFactory::Create(std::move(processor), resource);
        otel::trace::Provider::SetTracerProvider(
            otel::nostd::shared_ptr<otel::trace::TracerProvider>(provider));
        tracer_ = provider->GetTracer(serviceName);

        initialized_ = true;
        TRIVIUM_INFO("OpenTelemetry tracer initialized: service={}, endpoint={}", serviceName, endpoint);
        return true;
    } catch (const std::exception& e) {
        TRIVIUM_ERROR("Failed to initialize OpenTelemetry tracer: {}", e.what());
        return false;
    }
#else
    (void)serviceName;
    (void)endpoint;
    (void)&collectorReachable;
    TRIVIUM_INFO("Tracing disabled (TRIVIUM_ENABLE_TRACING not defined)");
    initialized_ = true;
    return true;
#endif
}

void Tracer::shutdown() {
    if (!initialized_) return;
#ifdef TRIVIUM_ENABLE_TRACING
    auto provider = otel::trace::Provider::GetTracerProvider();
    if (auto* sdk_provider = dynamic_cast<otel_sdk::trace::TracerProvider*>(provider.get())) {
        sdk_provider->Shutdown();
    }
    tracer_ = nullptr;
    TRIVIUM_INFO("OpenTelemetry tracer shut down");
#endif
    initialized_ = false;
}

Tracer::Span Tracer::startSpan(const std::string& name) {
#ifdef TRIVIUM_ENABLE_TRACING
    if (!initialized_ || tracer_ == nullptr) return Span();
    return Span(tracer_->StartSpan(name));
#else
    (void)name;
    return Span();
#endif
}

#ifdef TRIVIUM_ENABLE_TRACING
Tracer::Span::Span(otel::nostd::shared_ptr<otel::trace::Span> span)
    : span_(std::move(span)), valid_(span_ != nullptr) {}
#endif

Tracer::Span::~Span() {
    if (valid_ && !ended_) end();
}

Tracer::Span::Span(Span&& other) noexcept
    : valid_(other.valid_), ended_(other.ended_) {
#ifdef TRIVIUM_ENABLE_TRACING
    span_ = std::move(other.span_);
#endif
    other.valid_ = false;
}

Tracer::Span& Tracer::Span::operator=(Span&& other) noexcept {
    if (this != &other) {
        if (valid_ && !ended_) end();
        valid_ = other.valid_;
        ended_ = other.ended_;
#ifdef TRIVIUM_ENABLE_TRACING
        span_ = std::move(other.span_);
#endif
        other.valid_ = false;
    }
    return *this;
}

#ifdef TRIVIUM_ENABLE_TRACING
#define TRIVIUM_SPAN_SET(key, value) if (span_) span_->SetAttribute(key, value)
#else
#define TRIVIUM_SPAN_SET(key, value) (void)(key), (void)(value)
#endif

void Tracer::Span::setAttribute(const std::string& key, const std::string& value) { TRIVIUM_SPAN_SET(key, value); }
void Tracer::Span::setAttribute(const std::string& key, int64_t value) { TRIVIUM_SPAN_SET(key, value); }
void Tracer::Span::setAttribute(const std::string& key, bool value) { TRIVIUM_SPAN_SET(key, value); }

#undef TRIVIUM_SPAN_SET

void Tracer::Span::recordError(const std::string& errorMessage) {
#ifdef TRIVIUM_ENABLE_TRACING
    if (span_) {
        span_->AddEvent("exception", {{"exception.message", errorMessage}});
        span_->SetStatus(otel::trace::StatusCode::kError, errorMessage);
    }
#else
    (void)errorMessage;
#endif
}

void Tracer::Span::setStatus(bool ok, const std::string& description) {
#ifdef TRIVIUM_ENABLE_TRACING
    if (span_) {
        span_->SetStatus(ok ? otel::trace::StatusCode::kOk : otel::trace::StatusCode::kError, description);
    }
#else
    (void)ok;
    (void)description;
#endif
}

void Tracer::Span::end() {
#ifdef TRIVIUM_ENABLE_TRACING
    if (span_ && !ended_) span_->End();
#endif
    ended_ = true;
}

} // namespace trivium
