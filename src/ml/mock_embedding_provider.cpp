#include <spdlog/spdlog.h>
#include <cctype>
#include <cmath>
#include <functional>
#include <map>
#include <mutex>
#include <random>
#include <tripsift/ml/provider.h>

namespace tripsift::ml {

// ============================================================================
// Mock Embedding Provider Implementation
// ============================================================================

namespace {

std::vector<std::string> tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    for (unsigned char c : text) {
        if (std::isalnum(c) || c >= 0x80) {
            current.push_back(static_cast<char>(std::tolower(c)));
        } else if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty())
        tokens.push_back(std::move(current));
    return tokens;
}

} // namespace

MockEmbeddingProvider::MockEmbeddingProvider(size_t dimension)
    : dimension_(dimension), initialized_(false) {
    spdlog::debug("MockEmbeddingProvider created with dimension {}", dimension);
}

MockEmbeddingProvider::~MockEmbeddingProvider() {
    if (initialized_) {
        shutdown();
    }
}

Result<void> MockEmbeddingProvider::initialize() {
    if (initialized_) {
        return Result<void>();
    }
    if (dimension_ == 0) {
        return Error{ErrorCode::InvalidArgument, "Mock provider dimension must be positive"};
    }

    spdlog::debug("Initializing MockEmbeddingProvider");
    initialized_ = true;
    return Result<void>();
}

void MockEmbeddingProvider::shutdown() {
    if (!initialized_) {
        return;
    }

    spdlog::debug("Shutting down MockEmbeddingProvider");
    initialized_ = false;
}

Result<std::vector<float>> MockEmbeddingProvider::generateEmbedding(const std::string& text) {
    if (!initialized_) {
        return Error{ErrorCode::NotInitialized, "Mock provider not initialized"};
    }

    std::vector<float> embedding(dimension_, 0.0f);
    auto tokens = tokenize(text);
    if (tokens.empty()) {
        // Whole-text seed keeps blank or punctuation-only input deterministic
        tokens.push_back(text);
    }

    // Each token contributes a deterministic pseudo-random direction
    std::hash<std::string> hasher;
    for (const auto& token : tokens) {
        std::mt19937 gen(static_cast<std::mt19937::result_type>(hasher(token)));
        std::normal_distribution<float> dist(0.0f, 1.0f);
        for (size_t i = 0; i < dimension_; ++i) {
            embedding[i] += dist(gen);
        }
    }

    // Normalize to unit length
    float norm = 0.0f;
    for (float val : embedding) {
        norm += val * val;
    }
    norm = std::sqrt(norm);

    if (norm > 0) {
        for (float& val : embedding) {
            val /= norm;
        }
    }

    return embedding;
}

Result<std::vector<std::vector<float>>>
MockEmbeddingProvider::generateBatchEmbeddings(const std::vector<std::string>& texts) {
    if (!initialized_) {
        return Error{ErrorCode::NotInitialized, "Mock provider not initialized"};
    }

    std::vector<std::vector<float>> embeddings;
    embeddings.reserve(texts.size());

    for (const auto& text : texts) {
        auto result = generateEmbedding(text);
        if (!result) {
            return result.error();
        }
        embeddings.push_back(std::move(result).value());
    }

    return embeddings;
}

// ============================================================================
// Provider Factory Implementation
// ============================================================================

namespace {

std::mutex& registryMutex() {
    static std::mutex mutex;
    return mutex;
}

std::map<std::string, EmbeddingProviderFactory>& registry() {
    static std::map<std::string, EmbeddingProviderFactory> providers = {
        {"Mock", []() -> std::unique_ptr<IEmbeddingProvider> {
             return std::make_unique<MockEmbeddingProvider>();
         }}};
    return providers;
}

} // namespace

void registerEmbeddingProvider(const std::string& name, EmbeddingProviderFactory factory) {
    std::lock_guard<std::mutex> lock(registryMutex());
    registry()[name] = factory;
}

std::vector<std::string> getRegisteredEmbeddingProviders() {
    std::lock_guard<std::mutex> lock(registryMutex());
    std::vector<std::string> names;
    for (const auto& [name, _] : registry()) {
        names.push_back(name);
    }
    return names;
}

std::unique_ptr<IEmbeddingProvider> createEmbeddingProvider(const std::string& preferredProvider) {
    std::lock_guard<std::mutex> lock(registryMutex());
    auto& providers = registry();

    if (!preferredProvider.empty()) {
        auto it = providers.find(preferredProvider);
        if (it != providers.end()) {
            return it->second();
        }
        spdlog::warn("Preferred embedding provider '{}' not found", preferredProvider);
    }

    if (auto it = providers.find("Mock"); it != providers.end()) {
        spdlog::debug("Using Mock embedding provider");
        return it->second();
    }

    spdlog::error("No embedding providers available");
    return nullptr;
}

} // namespace tripsift::ml
