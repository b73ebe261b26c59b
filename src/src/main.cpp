#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <mk/modelkit.h>

using namespace mk;

static void try_validate(const Model& obj, std::optional<bool> allow_unknown_data = std::nullopt) {
    std::cout << "Validation of " << obj << " ";
    try {
        obj.validate(allow_unknown_data);
        std::cout << "succeeded\n";
    } catch (const ValidationFailure& e) {
        std::cout << "failed: " << e.what() << "\n";
    }
}

int main(int argc, char** argv) {
    bool strict = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--strict") {
            strict = true;
        } else {
            std::cerr << "usage: modelkit-demo [--strict]\n";
            return 2;
        }
    }

    auto package = ModelBuilder("Package")
                               .field("version", std::make_shared<StringField>())
                               .field("compatible_with",
                                      std::make_shared<DictField>(
                                                  nullptr,
                                                  std::make_shared<ListField>(std::make_shared<StringField>())))
                               .build();
    std::cout << "Declared " << package->describe() << "\n";

    Model p = package->construct();
    try_validate(p);

    p.set("version", "1.0");
    p.set("compatible_with", Dictionary{{"key", "value"}});
    try_validate(p);

    p["compatible_with"]["key"] = std::vector<std::string>{"value1", "value2"};
    try_validate(p);

    if (strict) {
        p.set("maintainer", "nobody");
        try_validate(p, false);
    }

    try {
        package->construct({{"name", "oops"}});
    } catch (const UnexpectedKeyword& e) {
        std::cout << "Construction failed: " << e.what() << "\n";
    }
    return 0;
}
