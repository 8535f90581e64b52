//
// Created by gregorian-rayne on 1/23/26.
//

#include "depmap/resolve/import_resolver.hpp"

#include <gtest/gtest.h>

namespace depmap::resolve
{
    class ImportResolverTest : public ::testing::Test {
    protected:
        void SetUp() override {
            add("app", true, "app");
            add("app.core", true, "app.core");
            add("app.core.engine", false, "app.core");
            add("app.utils", false, "app");
            add("main", false, "");
            add("json", false, "");
            add("ns.mod", false, "ns");
        }

        void add(const ModuleId& id, const bool is_package, const std::string& package) {
            Module module;
            module.id = id;
            module.is_package = is_package;
            module.package = package;
            registry.add(std::move(module));
        }

        [[nodiscard]] Resolution resolve(const std::string& target, const ModuleId& from, const std::size_t depth = 0) const {
            const ImportResolver resolver(registry, StdlibTable::python());
            RawImport raw;
            raw.target = target;
            raw.depth = depth;
            raw.kind = depth > 0 ? ImportKind::Relative : ImportKind::Absolute;
            raw.origin = from;
            return resolver.resolve(raw, *registry.find(from));
        }

        scanner::ModuleRegistry registry;
    };

    TEST_F(ImportResolverTest, StandardLibrary) {
        const auto resolution = resolve("os.path", "main");
        EXPECT_EQ(resolution.classification, ImportClass::StandardLibrary);
        EXPECT_FALSE(resolution.target.has_value());
    }

    TEST_F(ImportResolverTest, ThirdParty) {
        EXPECT_EQ(resolve("requests", "main").classification, ImportClass::ThirdParty);
        EXPECT_EQ(resolve("ghost.thing", "main").classification, ImportClass::ThirdParty);
    }

    TEST_F(ImportResolverTest, AbsoluteLocalModule) {
        const auto resolution = resolve("app.core.engine", "main");
        ASSERT_TRUE(resolution.is_local());
        EXPECT_EQ(*resolution.target, "app.core.engine");
    }

    TEST_F(ImportResolverTest, FromImportOfSymbolResolvesToModule) {
        // from app.core.engine import Engine
        const auto resolution = resolve("app.core.engine.Engine", "main");
        ASSERT_TRUE(resolution.is_local());
        EXPECT_EQ(*resolution.target, "app.core.engine");
    }

    TEST_F(ImportResolverTest, FromPackageImportSubmodule) {
        // from app import utils
        const auto resolution = resolve("app.utils", "main");
        ASSERT_TRUE(resolution.is_local());
        EXPECT_EQ(*resolution.target, "app.utils");
    }

    TEST_F(ImportResolverTest, UnknownNameInPackageFallsBackToPackage) {
        const auto resolution = resolve("app.missing", "main");
        ASSERT_TRUE(resolution.is_local());
        EXPECT_EQ(*resolution.target, "app");
    }

    TEST_F(ImportResolverTest, LocalShadowsStandardLibrary) {
        const auto resolution = resolve("json", "app.utils");
        ASSERT_TRUE(resolution.is_local());
        EXPECT_EQ(*resolution.target, "json");
    }

    TEST_F(ImportResolverTest, LocalNamespaceWithoutMatchIsUnresolvable) {
        EXPECT_EQ(resolve("ns.other", "main").classification, ImportClass::Unresolvable);
        EXPECT_EQ(*resolve("ns.mod", "main").target, "ns.mod");
    }

    TEST_F(ImportResolverTest, NoImplicitSiblingLookup) {
        // "import engine" inside app.core is absolute; there is no top-level engine
        EXPECT_EQ(resolve("engine", "app.core.engine").classification, ImportClass::ThirdParty);
    }

    TEST_F(ImportResolverTest, RelativeFromCurrentPackage) {
        // from .engine import Engine, inside app.core
        const auto resolution = resolve("engine.Engine", "app.core", 1);
        ASSERT_TRUE(resolution.is_local());
        EXPECT_EQ(*resolution.target, "app.core.engine");
    }

    TEST_F(ImportResolverTest, RelativeSymbolFromPackageInit) {
        // from . import helpers, inside app.core.engine
        const auto resolution = resolve("helpers", "app.core.engine", 1);
        ASSERT_TRUE(resolution.is_local());
        EXPECT_EQ(*resolution.target, "app.core");
    }

    TEST_F(ImportResolverTest, RelativeClimbsPackages) {
        // from ..utils import x, inside app.core.engine
        const auto resolution = resolve("utils.x", "app.core.engine", 2);
        ASSERT_TRUE(resolution.is_local());
        EXPECT_EQ(*resolution.target, "app.utils");
    }

    TEST_F(ImportResolverTest, RelativeBeyondTopIsUnresolvable) {
        EXPECT_EQ(resolve("x", "app.core.engine", 4).classification, ImportClass::Unresolvable);
    }

    TEST_F(ImportResolverTest, RelativeNeverFallsBackToStdlib) {
        EXPECT_EQ(resolve("os", "main", 1).classification, ImportClass::Unresolvable);
    }

    TEST_F(ImportResolverTest, RelativeFromRootLevelModule) {
        const auto resolution = resolve("app", "main", 1);
        ASSERT_TRUE(resolution.is_local());
        EXPECT_EQ(*resolution.target, "app");
    }

    TEST_F(ImportResolverTest, ExtraStdlibModules) {
        auto table = StdlibTable::python();
        table.add("_vendor");
        const ImportResolver resolver(registry, std::move(table));

        RawImport raw;
        raw.target = "_vendor.six";
        EXPECT_EQ(resolver.resolve(raw, *registry.find("main")).classification, ImportClass::StandardLibrary);
    }

    TEST(ImportResolverRootPackageTest, RootPackageNameIsStripped) {
        scanner::ModuleRegistry registry;

        Module root;
        root.id = "myproj";
        root.is_package = true;
        registry.add(root);

        Module core;
        core.id = "core";
        registry.add(core);

        ASSERT_TRUE(registry.root_package().has_value());

        const ImportResolver resolver(registry, StdlibTable::python());
        RawImport raw;
        raw.target = "myproj.core";

        const auto resolution = resolver.resolve(raw, core);
        ASSERT_TRUE(resolution.is_local());
        EXPECT_EQ(*resolution.target, "core");
    }
}  // namespace depmap::resolve
