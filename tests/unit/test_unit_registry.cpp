/**
 * @file test_unit_registry.cpp
 * @brief Unit tests for UnitRegistry lifecycle, export and restore.
 */

#include "model/unit_registry.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <gtest/gtest.h>

#include <filesystem>

using namespace archetype;
using json = nlohmann::json;

namespace {

Device test_cpu() {
    Device dev;
    dev.id = "cpu:0";
    dev.name = "Test CPU";
    dev.vendor = Vendor::Intel;
    dev.backend = BackendKind::CpuFallback;
    dev.performance_score = 100;
    return dev;
}

const json kTinyMlp = {{"layers", {4, 8, 3}}};

}  // namespace

class UnitRegistryTest : public ::testing::Test {
protected:
    Logger logger_{std::make_unique<NullSink>()};
    CpuReferenceEngine engine_;
    DeviceCatalog catalog_{logger_, std::make_unique<MockProbe>(BackendKind::CpuFallback,
                                                               std::vector<Device>{test_cpu()})};
    DeviceSelector selector_{catalog_, engine_, logger_};
    ModelBuilderRegistry builders_;
    InMemoryMetadataStore store_;
    MetricsCollector metrics_{std::make_unique<NullSink>()};
    std::filesystem::path export_dir_ =
        std::filesystem::temp_directory_path() / "archetype_registry_test";
    std::unique_ptr<UnitRegistry> registry_;

    void SetUp() override {
        std::filesystem::remove_all(export_dir_);
        ASSERT_TRUE(selector_.auto_select().has_value());
        registry_ = make_registry();
    }

    void TearDown() override { std::filesystem::remove_all(export_dir_); }

    std::unique_ptr<UnitRegistry> make_registry() {
        return std::make_unique<UnitRegistry>(builders_, selector_, engine_, store_, logger_,
                                              UnitRegistry::Options{export_dir_}, &metrics_);
    }

    UnitMetadata create_tiny(const std::string& name = "tiny") {
        auto created = registry_->create(name, "mlp", kTinyMlp, {{"learning_rate", 0.01}});
        EXPECT_TRUE(created.has_value());
        return *created;
    }
};

TEST_F(UnitRegistryTest, CreateGetDeleteRoundTrip) {
    auto meta = create_tiny();
    EXPECT_FALSE(meta.id.empty());
    EXPECT_EQ(meta.type, UnitType::Mlp);
    EXPECT_EQ(meta.parameter_count, 4u * 8u + 8u + 8u * 3u + 3u);
    EXPECT_EQ(meta.device_id, "cpu:0");
    EXPECT_EQ(meta.status, "created");

    auto fetched = registry_->get(meta.id);
    ASSERT_TRUE(fetched.has_value());
    EXPECT_EQ(fetched->name, "tiny");
    EXPECT_TRUE(store_.load(meta.id).has_value());

    ASSERT_TRUE(registry_->remove(meta.id).has_value());
    auto gone = registry_->get(meta.id);
    ASSERT_FALSE(gone.has_value());
    EXPECT_EQ(gone.error().code, ErrorCode::NotFound);
    EXPECT_FALSE(store_.load(meta.id).has_value());

    auto again = registry_->remove(meta.id);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::NotFound);
}

TEST_F(UnitRegistryTest, TypeTagIsCaseInsensitive) {
    auto created = registry_->create("upper", "MLP", kTinyMlp, json::object());
    ASSERT_TRUE(created.has_value());
    EXPECT_EQ(created->type, UnitType::Mlp);
}

TEST_F(UnitRegistryTest, UnknownTypeIsUnsupported) {
    auto created = registry_->create("x", "transformer", json::object(), json::object());
    ASSERT_FALSE(created.has_value());
    EXPECT_EQ(created.error().code, ErrorCode::UnsupportedType);
    EXPECT_EQ(registry_->count(), 0u);
}

TEST_F(UnitRegistryTest, InvalidArchitectureIsRejected) {
    auto created = registry_->create("x", "mlp", {{"layers", json::array({5})}}, json::object());
    ASSERT_FALSE(created.has_value());
    EXPECT_EQ(created.error().code, ErrorCode::InvalidArgument);
}

TEST_F(UnitRegistryTest, ListKeepsCreationOrderAndPaginates) {
    auto a = create_tiny("a");
    auto b = create_tiny("b");
    auto c = create_tiny("c");

    auto all = registry_->list();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].id, a.id);
    EXPECT_EQ(all[1].id, b.id);
    EXPECT_EQ(all[2].id, c.id);

    auto page = registry_->list(1, 1);
    ASSERT_EQ(page.size(), 1u);
    EXPECT_EQ(page[0].id, b.id);
    EXPECT_TRUE(registry_->list(5, 10).empty());
}

TEST_F(UnitRegistryTest, UpdateMergesAllowedFields) {
    auto meta = create_tiny();
    auto updated = registry_->update(meta.id, {{"name", "renamed"},
                                               {"hyperparameters", {{"batch_size", 16}}}});
    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated->name, "renamed");
    EXPECT_EQ(updated->hyperparameters["batch_size"], 16);
    EXPECT_DOUBLE_EQ(updated->hyperparameters["learning_rate"].get<double>(), 0.01);
    EXPECT_GE(updated->updated_at, meta.updated_at);
}

TEST_F(UnitRegistryTest, UpdateRejectsImmutableFields) {
    auto meta = create_tiny();
    auto arch = registry_->update(meta.id, {{"architecture", {{"layers", {2, 2}}}}});
    ASSERT_FALSE(arch.has_value());
    EXPECT_EQ(arch.error().code, ErrorCode::InvalidArgument);

    auto bad_name = registry_->update(meta.id, {{"name", 5}});
    ASSERT_FALSE(bad_name.has_value());
    EXPECT_EQ(bad_name.error().code, ErrorCode::InvalidArgument);

    auto missing = registry_->update("no-such-id", {{"name", "x"}});
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);
}

TEST_F(UnitRegistryTest, CannotDeleteWhileAcquired) {
    auto meta = create_tiny();
    {
        auto unit = registry_->acquire(meta.id);
        ASSERT_TRUE(unit.has_value());
        auto removed = registry_->remove(meta.id);
        ASSERT_FALSE(removed.has_value());
        EXPECT_EQ(removed.error().code, ErrorCode::InvalidState);
    }
    EXPECT_TRUE(registry_->remove(meta.id).has_value());
}

TEST_F(UnitRegistryTest, ExportFormats) {
    auto meta = create_tiny();

    auto native = registry_->export_unit(meta.id, "pt");
    ASSERT_TRUE(native.has_value());
    EXPECT_EQ(native->filename().string(), meta.id + ".pt");
    EXPECT_TRUE(std::filesystem::exists(*native));

    auto interchange = registry_->export_unit(meta.id, "json");
    ASSERT_TRUE(interchange.has_value());
    EXPECT_TRUE(std::filesystem::exists(*interchange));

    auto onnx = registry_->export_unit(meta.id, "onnx");
    ASSERT_FALSE(onnx.has_value());
    EXPECT_EQ(onnx.error().code, ErrorCode::UnsupportedFormat);

    auto missing = registry_->export_unit("no-such-id", "pt");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);
}

TEST_F(UnitRegistryTest, ParseExportFormat) {
    EXPECT_EQ(parse_export_format("PTH"), ExportFormat::Native);
    EXPECT_EQ(parse_export_format("bin"), ExportFormat::Native);
    EXPECT_EQ(parse_export_format("json"), ExportFormat::Interchange);
    EXPECT_FALSE(parse_export_format("onnx").has_value());
}

TEST_F(UnitRegistryTest, SetStatusPersists) {
    auto meta = create_tiny();
    ASSERT_TRUE(registry_->set_status(meta.id, "training").has_value());
    EXPECT_EQ(registry_->get(meta.id)->status, "training");
    auto record = store_.load(meta.id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ((*record)["status"], "training");
}

TEST_F(UnitRegistryTest, RestoreRebuildsFromStore) {
    auto a = create_tiny("a");
    auto b = create_tiny("b");

    auto fresh = make_registry();
    EXPECT_EQ(fresh->count(), 0u);
    EXPECT_EQ(fresh->restore(), 2u);
    EXPECT_EQ(fresh->list().size(), 2u);
    auto restored = fresh->get(a.id);
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(restored->name, "a");
    EXPECT_EQ(restored->parameter_count, a.parameter_count);
    EXPECT_TRUE(fresh->get(b.id).has_value());

    // already-known ids are skipped
    EXPECT_EQ(fresh->restore(), 0u);
}

TEST_F(UnitRegistryTest, RecordsUnitTelemetry) {
    auto before = metrics_.event_count();
    auto meta = create_tiny();
    ASSERT_TRUE(registry_->remove(meta.id).has_value());
    EXPECT_EQ(metrics_.event_count(), before + 2);
}
