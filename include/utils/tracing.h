#pragma once

#include <cstdint>
#include <string>

#ifdef TRIVIUM_ENABLE_TRACING
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/tracer.h>
#include <opentelemetry/context/context.h>
namespace otel = opentelemetry;
#endif

namespace trivium {

/**
 * Tracer wrapper for OpenTelemetry distributed tracing.
 *
 * Without TRIVIUM_ENABLE_TRACING every call is a no-op, so query code can
 * open spans unconditionally:
 *
 *   auto span = Tracer::startSpan("QueryEngine.execute");
 *   span.setAttribute("query.object_type", "Car");
 *   // span ends in its destructor
 */
class Tracer {
public:
    /**
     * Install the global tracer with an OTLP/HTTP exporter.
     * @param serviceName reported as service.name
     * @param endpoint collector base URL, e.g. "http://localhost:4318"
     * @return false when the collector is unreachable or setup fails
     */
    static bool initialize(const std::string& serviceName, const std::string& endpoint);

    static void shutdown();

    /// RAII span; move-only
    class Span {
    public:
        Span() = default;
        ~Span();

        Span(Span&& other) noexcept;
        Span& operator=(Span&& other) noexcept;
        Span(const Span&) = delete;
        Span& operator=(const Span&) = delete;

        void setAttribute(const std::string& key, const std::string& value);
        void setAttribute(const std::string& key, int64_t value);
        void setAttribute(const std::string& key, bool value);

        void recordError(const std::string& errorMessage);
        void setStatus(bool ok, const std::string& description = "");
        void end();

        bool isValid() const { return valid_; }

    private:
        friend class Tracer;

#ifdef TRIVIUM_ENABLE_TRACING
        explicit Span(otel::nostd::shared_ptr<otel::trace::Span> span);
        otel::nostd::shared_ptr<otel::trace::Span> span_;
#endif
        bool valid_ = false;
        bool ended_ = false;
    };

    static Span startSpan(const std::string& name);

    static bool isInitialized() { return initialized_; }

private:
#ifdef TRIVIUM_ENABLE_TRACING
    static otel::nostd::shared_ptr<otel::trace::Tracer> tracer_;
#endif
    static bool initialized_;
};

} // namespace trivium
