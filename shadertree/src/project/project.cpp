#include <shadertree/project/project.hpp>

#include <cstring>

#include <shadertree/ext/bindings.hpp>
#include <shadertree/ext/minifier.hpp>
#include <shadertree/ext/size_report.hpp>
#include <shadertree/runtime/logger.hpp>

namespace st {

auto parse_project_options(int argc, char** argv) -> ProjectOptions {
    ProjectOptions opt{};

    if (argc < 2) { return opt; }
    opt.project_file = argv[1];

    for (int i = 2; i < argc; i++) {
        if (strcmp(argv[i], "-release") == 0) {
            opt.release = true;
        } else if (strcmp(argv[i], "-verbose") == 0) {
            opt.verbose = true;
        } else {
            log::warn("general", "Unknown command line option '{}'", argv[i]);
        }
    }

    return opt;
}

auto make_extensions(build::BuildSettings const& settings) -> build::ExtensionRegistry {
    build::ExtensionRegistry extensions{};
    if (settings.bindings.enabled) {
        extensions.push_back(Box<ext::BindingsExtension>::make(
            settings.bindings.output_dir,
            ext::BindingsOptions{
                .root_namespace = settings.bindings.root_namespace,
                .index_file = settings.bindings.index_file,
            }
        ));
    }
    if (settings.minifier.enabled) {
        extensions.push_back(Box<ext::MinifierExtension>::make(ext::MinifierOptions{
            .release_only = settings.minifier.release_only,
            .profile = settings.profile,
        }));
    }
    if (settings.size_report.enabled) {
        extensions.push_back(Box<ext::SizeReportExtension>::make());
    }
    return extensions;
}

auto make_publishers(build::BuildSettings const& settings) -> std::vector<Box<build::BuildPublisher>> {
    std::vector<Box<build::BuildPublisher>> publishers{};
    if (settings.publish_environment) {
        publishers.push_back(Box<build::EnvironmentPublisher>::make());
    }
    if (settings.manifest_path) {
        publishers.push_back(Box<build::ManifestPublisher>::make(settings.manifest_path.value()));
    }
    if (settings.depfile_path) {
        auto target = settings.manifest_path.value_or(settings.output_dir).generic_string();
        publishers.push_back(Box<build::DepfilePublisher>::make(settings.depfile_path.value(), std::move(target)));
    }
    return publishers;
}

auto run_project(build::BuildSettings const& settings) -> Expected<build::BuildOutput, build::BuildError> {
    std::error_code ec;
    std::filesystem::create_directories(settings.output_dir, ec);
    if (ec) {
        return build::BuildError::io(settings.output_dir, ec);
    }

    auto extensions = make_extensions(settings);
    auto publishers = make_publishers(settings);
    build::ShaderBuildDesc desc{
        .shader_root = settings.shader_root,
        .output_dir = settings.output_dir,
        .compile_options = settings.compile_options,
    };
    return build::build_shader_dir(desc, extensions, publishers);
}

auto run_project_main(int argc, char** argv) -> int {
    auto opt = parse_project_options(argc, argv);
    if (!opt.project_file) {
        log::critical("general", "Project file is not specified.");
        return -1;
    }

    auto settings = build::BuildSettings::load(opt.project_file);
    if (!settings) {
        log::critical("general", "Failed to load project file: {}", settings.error());
        return -1;
    }
    if (opt.release) {
        settings.value().profile = "release";
    }

    auto& logger_manager = rt::logger_manager();
    logger_manager.set_level(
        opt.verbose ? rt::LogLevel::debug : rt::log_level_from_env().value_or(settings.value().log_level)
    );
    if (settings.value().log_file && !logger_manager.add_file_sink(settings.value().log_file.value())) {
        return -1;
    }

    auto output = run_project(settings.value());
    if (!output) {
        log::error("build", "{}", output.error().to_string());
        return 1;
    }
    return 0;
}

}
