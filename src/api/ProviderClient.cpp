#include "api/ProviderClient.hpp"
#include "api/AnthropicClient.hpp"
#include "api/HttplibTransport.hpp"
#include "api/OpenAIClient.hpp"

std::unique_ptr<ProviderClient> makeProviderClient(const ProviderCredentials& creds,
                                                   const ClientConfig& config)
{
    switch (creds.provider) {
        case Provider::OpenAI:
            return std::make_unique<OpenAIClient>(
                std::make_shared<HttplibTransport>(config.openaiBaseUrl, config.timeoutMs),
                creds.apiKey);
        case Provider::Anthropic:
            return std::make_unique<AnthropicClient>(
                std::make_shared<HttplibTransport>(config.anthropicBaseUrl, config.timeoutMs),
                creds.apiKey);
    }
    return nullptr;
}
