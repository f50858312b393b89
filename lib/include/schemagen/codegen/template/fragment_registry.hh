//
// Fragment Registry - a renderer's fragments, compiled once and bound to
// the transforms that turn models into dictionaries
//

#pragma once

#include <schemagen/codegen/template/dictionary.hh>
#include <schemagen/codegen/template/fragment.hh>
#include <schemagen/codegen/template/fragment_loader.hh>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace schemagen::codegen {

// ============================================================================
// Bound Fragment
// ============================================================================

/**
 * A compiled fragment bound to the transform that turns a model into its
 * dictionary.
 *
 * \code
 *   auto enum_fragment = registry.bind<ast::enum_def>("enum", [](const ast::enum_def& e) {
 *       return Dictionary{{"enum_name", e.name}};
 *   });
 *
 *   std::string code = enum_fragment.render(color_enum);
 *   Dictionary item = enum_fragment.unpack(color_enum);  // for embedding in a list
 * \endcode
 */
template<typename Model>
class BoundFragment {
public:
    using Transform = std::function<Dictionary(const Model&)>;

    BoundFragment(FragmentPtr fragment, Transform transform)
        : fragment_(std::move(fragment)),
          transform_(std::move(transform)) {}

    /// Apply the transform, then render the fragment
    [[nodiscard]] std::string render(const Model& model) const {
        return fragment_->render(transform_(model));
    }

    /// Apply the transform alone
    [[nodiscard]] Dictionary unpack(const Model& model) const {
        return transform_(model);
    }

    [[nodiscard]] const Transform& unpacker() const { return transform_; }

    /// Compiled fragment, for storing as a partial in another dictionary
    [[nodiscard]] const FragmentPtr& fragment() const { return fragment_; }

private:
    FragmentPtr fragment_;
    Transform transform_;
};

// ============================================================================
// Fragment Registry
// ============================================================================

/**
 * Immutable set of compiled fragments.
 *
 * Built once per generation session: every requested fragment is loaded and
 * compiled up front, so syntax errors surface at construction and the
 * registry can be shared between threads afterwards.
 *
 * \code
 *   MemoryFragmentLoader loader;
 *   loader.add("scala/enum", "...");
 *   FragmentRegistry registry(loader, "scala/", {"enum"});
 * \endcode
 */
class FragmentRegistry {
public:
    /**
     * Load and compile fragments.
     *
     * @param loader Source of fragment text
     * @param prefix Namespace passed to the loader (e.g., "scala/")
     * @param names Fragments to load
     * @throws fragment_not_found_error if the loader lacks a fragment
     * @throws template_error if a fragment does not compile
     */
    FragmentRegistry(const FragmentLoader& loader,
                     const std::string& prefix,
                     const std::vector<std::string>& names);

    /// @throws fragment_not_found_error for unknown names
    [[nodiscard]] const FragmentPtr& get(const std::string& name) const;

    [[nodiscard]] bool has(const std::string& name) const;

    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] const std::string& prefix() const { return prefix_; }

    /// Bind a fragment to a model transform
    template<typename Model>
    [[nodiscard]] BoundFragment<Model> bind(const std::string& name,
                                            typename BoundFragment<Model>::Transform transform) const {
        return BoundFragment<Model>(get(name), std::move(transform));
    }

private:
    std::string prefix_;
    std::map<std::string, FragmentPtr> fragments_;
};

}  // namespace schemagen::codegen
