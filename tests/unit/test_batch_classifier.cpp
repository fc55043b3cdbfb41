#include <catch2/catch_test_macros.hpp>
#include "BatchClassifier.hpp"
#include "TestHelpers.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace {
ClassifierOptions fast_options(int max_attempts = 3) {
    ClassifierOptions options;
    options.model = "test-model";
    options.max_attempts = max_attempts;
    options.retry_delay = std::chrono::milliseconds(0);
    return options;
}

Batch make_batch(const std::vector<std::string>& names) {
    Batch batch;
    for (const auto& name : names) {
        batch.push_back(FileEntry{"/tmp/" + name, name});
    }
    return batch;
}
}

TEST_CASE("prompt lists every file name as a JSON array and keeps the rules") {
    const std::string prompt = BatchClassifier::build_prompt({"song.mp3", "曲.wav", "a \"quoted\".txt"});

    CHECK(prompt.find(R"(Filenames: ["song.mp3","曲.wav","a \"quoted\".txt"])") != std::string::npos);
    CHECK(prompt.find("Group files primarily by file extension and type") != std::string::npos);
    CHECK(prompt.find("Do NOT translate Japanese or other non-Latin filenames") != std::string::npos);
    CHECK(prompt.find("Use specific categories only if") != std::string::npos);
    CHECK(prompt.find("Return ONLY a JSON object") != std::string::npos);
    CHECK(prompt.find(R"("song.mp3": "Music")") != std::string::npos);
}

TEST_CASE("first valid response is returned without retrying") {
    ScriptedInferenceClient client;
    client.push_response(R"({"a.txt":"Docs","b.mp3":"Music"})");

    BatchClassifier classifier(client, fast_options(), nullptr);
    const auto mapping = classifier.classify(make_batch({"a.txt", "b.mp3"}));

    REQUIRE(mapping.has_value());
    CHECK(mapping->at("a.txt") == "Docs");
    CHECK(mapping->at("b.mp3") == "Music");
    REQUIRE(client.calls() == 1);

    const auto& request = client.requests.front();
    CHECK(request.model == "test-model");
    CHECK_FALSE(request.stream);
    REQUIRE(request.format.has_value());
    CHECK(*request.format == "json");
    CHECK(request.prompt == BatchClassifier::build_prompt({"a.txt", "b.mp3"}));
}

TEST_CASE("format hint can be turned off") {
    ScriptedInferenceClient client;
    client.push_response("{}");

    auto options = fast_options();
    options.json_format_hint = false;
    BatchClassifier classifier(client, options, nullptr);
    REQUIRE(classifier.classify(make_batch({"a.txt"})).has_value());
    CHECK_FALSE(client.requests.front().format.has_value());
}

TEST_CASE("every kind of failed attempt is retried until one succeeds") {
    ScriptedInferenceClient client;
    client.push(GenerateResult::transport_error("connection refused"));
    client.push(GenerateResult::http_error(500, "model not loaded"));
    client.push(GenerateResult::envelope_error("missing response", "{}", 200));
    client.push_response("not json at all");
    client.push_response("```json\n{\"a.txt\":\"Docs\"}\n```");

    BatchClassifier classifier(client, fast_options(5), nullptr);
    const auto mapping = classifier.classify(make_batch({"a.txt"}));

    REQUIRE(mapping.has_value());
    CHECK(mapping->at("a.txt") == "Docs");
    CHECK(client.calls() == 5);
}

TEST_CASE("exhausted attempts skip the batch and report it once") {
    ScriptedInferenceClient client;
    client.push_response("garbage");
    client.push_response(R"({"a.txt": 1})");
    client.push(GenerateResult::http_error(503, ""));
    client.push_response(R"({"a.txt":"Docs"})");

    std::vector<std::string> progress;
    BatchClassifier classifier(client, fast_options(3), nullptr);
    const auto mapping = classifier.classify(make_batch({"a.txt"}),
                                             [&](const std::string& line) { progress.push_back(line); });

    CHECK_FALSE(mapping.has_value());
    CHECK(client.calls() == 3);
    CHECK(progress == std::vector<std::string>{
        "Failed to process batch after 3 attempts. Skipping batch."});
}

TEST_CASE("a single attempt means no retry") {
    ScriptedInferenceClient client;
    BatchClassifier classifier(client, fast_options(1), nullptr);

    CHECK_FALSE(classifier.classify(make_batch({"a.txt"})).has_value());
    CHECK(client.calls() == 1);
}

TEST_CASE("retry delay is waited between attempts but not after the last one") {
    ScriptedInferenceClient client;
    auto options = fast_options(3);
    options.retry_delay = std::chrono::milliseconds(20);
    BatchClassifier classifier(client, options, nullptr);

    const auto start = std::chrono::steady_clock::now();
    CHECK_FALSE(classifier.classify(make_batch({"a.txt"})).has_value());
    const auto elapsed = std::chrono::steady_clock::now() - start;

    CHECK(client.calls() == 3);
    CHECK(elapsed >= std::chrono::milliseconds(40));
}
