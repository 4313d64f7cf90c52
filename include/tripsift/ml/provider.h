#pragma once

#include <memory>
#include <string>
#include <vector>
#include <tripsift/core/types.h>

namespace tripsift::ml {

// ============================================================================
// Abstract Embedding Provider Interface
// ============================================================================

/**
 * Abstract interface for embedding providers
 * The search engine only depends on this interface; the concrete model or
 * remote service behind it lives outside the library.
 */
class IEmbeddingProvider {
public:
    virtual ~IEmbeddingProvider() = default;

    /**
     * Generate embedding for a single text
     * @param text Input text to embed
     * @return Vector of float embeddings or error
     */
    virtual Result<std::vector<float>> generateEmbedding(const std::string& text) = 0;

    /**
     * Generate embeddings for a batch of texts
     * @param texts Input texts to embed
     * @return Vector of embedding vectors or error
     */
    virtual Result<std::vector<std::vector<float>>>
    generateBatchEmbeddings(const std::vector<std::string>& texts) = 0;

    virtual bool isAvailable() const = 0;

    /**
     * Get the name of this provider (e.g., "Mock")
     */
    virtual std::string getProviderName() const = 0;

    virtual size_t getEmbeddingDimension() const = 0;

    virtual Result<void> initialize() = 0;

    virtual void shutdown() = 0;
};

/**
 * Mock embedding provider for testing and fixtures
 *
 * Feature-hashes lower-cased word tokens into a fixed size vector and
 * normalizes it to unit length, so equal texts embed identically and texts
 * that share words end up close together.
 */
class MockEmbeddingProvider : public IEmbeddingProvider {
public:
    explicit MockEmbeddingProvider(size_t dimension = 384);
    ~MockEmbeddingProvider() override;

    Result<void> initialize() override;
    void shutdown() override;

    Result<std::vector<float>> generateEmbedding(const std::string& text) override;
    Result<std::vector<std::vector<float>>>
    generateBatchEmbeddings(const std::vector<std::string>& texts) override;

    bool isAvailable() const override { return true; }
    std::string getProviderName() const override { return "Mock"; }
    size_t getEmbeddingDimension() const override { return dimension_; }

private:
    size_t dimension_;
    bool initialized_;
};

// ============================================================================
// Embedding Provider Factory
// ============================================================================

using EmbeddingProviderFactory = std::unique_ptr<IEmbeddingProvider> (*)();

/**
 * Create an embedding provider by registered name
 * Unknown or empty names fall back to the "Mock" provider.
 */
std::unique_ptr<IEmbeddingProvider>
createEmbeddingProvider(const std::string& preferredProvider = "");

void registerEmbeddingProvider(const std::string& name, EmbeddingProviderFactory factory);

std::vector<std::string> getRegisteredEmbeddingProviders();

} // namespace tripsift::ml
