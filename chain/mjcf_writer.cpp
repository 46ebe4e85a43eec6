#include "mjcf_writer.hpp"
#include <spdlog/fmt/fmt.h>
#include <tinyxml2.h>
#include <stdexcept>

namespace spirob {

namespace {

using tinyxml2::XMLDocument;
using tinyxml2::XMLElement;

std::string num(double v) {
    return fmt::format("{:.6f}", v);
}

std::string vec(const Vec3& v) {
    return fmt::format("{:.6f} {:.6f} {:.6f}", v.x, v.y, v.z);
}

XMLElement* add(XMLDocument& doc, XMLElement* parent, const char* tag) {
    XMLElement* element = doc.NewElement(tag);
    parent->InsertEndChild(element);
    return element;
}

void add_header(XMLDocument& doc, XMLElement* root, const ChainDescription& chain) {
    XMLElement* compiler = add(doc, root, "compiler");
    compiler->SetAttribute("angle", "radian");
    compiler->SetAttribute("meshdir", ".");

    XMLElement* option = add(doc, root, "option");
    option->SetAttribute("timestep", "0.002");
    option->SetAttribute("iterations", "50");
    option->SetAttribute("solver", "Newton");
    option->SetAttribute("tolerance", "1e-10");

    XMLElement* size = add(doc, root, "size");
    size->SetAttribute("nconmax", "500");
    size->SetAttribute("njmax", "1000");
    size->SetAttribute("nstack", "10000000");

    XMLElement* visual = add(doc, root, "visual");
    add(doc, visual, "rgba")->SetAttribute("haze", "0.15 0.25 0.35 1");
    add(doc, visual, "quality")->SetAttribute("shadowsize", "2048");
    add(doc, visual, "map")->SetAttribute("stiffness", "700");

    XMLElement* asset = add(doc, root, "asset");
    XMLElement* mesh = add(doc, asset, "mesh");
    mesh->SetAttribute("name", "unit_mesh");
    mesh->SetAttribute("file", chain.mesh_file.c_str());
    std::string scale = fmt::format("{0:.6f} {0:.6f} {0:.6f}", chain.mesh_scale);
    mesh->SetAttribute("scale", scale.c_str());

    XMLElement* texture = add(doc, asset, "texture");
    texture->SetAttribute("name", "groundplane");
    texture->SetAttribute("type", "2d");
    texture->SetAttribute("builtin", "checker");
    texture->SetAttribute("rgb1", ".2 .3 .4");
    texture->SetAttribute("rgb2", ".1 .2 .3");
    texture->SetAttribute("width", "100");
    texture->SetAttribute("height", "100");
    texture->SetAttribute("mark", "cross");
    texture->SetAttribute("markrgb", ".8 .8 .8");

    XMLElement* ground = add(doc, asset, "material");
    ground->SetAttribute("name", "groundplane");
    ground->SetAttribute("texture", "groundplane");
    ground->SetAttribute("texrepeat", "5 5");
    ground->SetAttribute("texuniform", "true");
    ground->SetAttribute("reflectance", ".2");

    XMLElement* robot = add(doc, asset, "material");
    robot->SetAttribute("name", "robot");
    robot->SetAttribute("rgba", "0.6 0.7 0.9 1");
}

XMLElement* add_world(XMLDocument& doc, XMLElement* root, const ChainDescription& chain) {
    XMLElement* world = add(doc, root, "worldbody");

    XMLElement* key = add(doc, world, "light");
    key->SetAttribute("directional", "true");
    key->SetAttribute("diffuse", ".8 .8 .8");
    key->SetAttribute("specular", ".2 .2 .2");
    key->SetAttribute("pos", "0 0 5");
    key->SetAttribute("dir", "0 0 -1");

    XMLElement* fill = add(doc, world, "light");
    fill->SetAttribute("directional", "true");
    fill->SetAttribute("diffuse", ".4 .4 .4");
    fill->SetAttribute("specular", ".1 .1 .1");
    fill->SetAttribute("pos", "0 0 4");
    fill->SetAttribute("dir", "0 -1 -1");

    XMLElement* plane = add(doc, world, "geom");
    plane->SetAttribute("name", "ground");
    plane->SetAttribute("type", "plane");
    plane->SetAttribute("size", "10 10 0.1");
    plane->SetAttribute("material", "groundplane");

    XMLElement* base = add(doc, world, "body");
    base->SetAttribute("name", "base");
    std::string base_pos = "0 0 " + num(chain.base_height);
    base->SetAttribute("pos", base_pos.c_str());

    XMLElement* base_geom = add(doc, base, "geom");
    base_geom->SetAttribute("name", "base_geom");
    base_geom->SetAttribute("type", "box");
    base_geom->SetAttribute("size", "0.05 0.05 0.05");
    base_geom->SetAttribute("rgba", "0.8 0.2 0.2 1");

    XMLElement* base_inertial = add(doc, base, "inertial");
    base_inertial->SetAttribute("pos", "0 0 0");
    base_inertial->SetAttribute("mass", "0.1");
    base_inertial->SetAttribute("diaginertia", "0.001 0.001 0.001");
    return base;
}

void add_link(XMLDocument& doc, XMLElement* parent, const BodyRecord& body,
              std::size_t index, const ChainDescription& chain) {
    XMLElement* link = add(doc, parent, "body");
    link->SetAttribute("name", body.name.c_str());
    std::string pos = num(body.offset) + " 0 0";
    link->SetAttribute("pos", pos.c_str());

    XMLElement* geom = add(doc, link, "geom");
    std::string geom_name = fmt::format("geom_{}", index);
    geom->SetAttribute("name", geom_name.c_str());
    geom->SetAttribute("type", "mesh");
    geom->SetAttribute("mesh", "unit_mesh");
    geom->SetAttribute("material", "robot");

    XMLElement* inertial = add(doc, link, "inertial");
    std::string inertial_pos = num(body.offset * 0.5) + " 0 0";
    inertial->SetAttribute("pos", inertial_pos.c_str());
    inertial->SetAttribute("mass", num(body.mass).c_str());
    std::string diag = fmt::format("{0:.6f} {0:.6f} {0:.6f}", body.inertia);
    inertial->SetAttribute("diaginertia", diag.c_str());

    XMLElement* joint = add(doc, link, "joint");
    joint->SetAttribute("name", body.joint_name.c_str());
    joint->SetAttribute("type", to_string(chain.joint));
    joint->SetAttribute("axis", "0 0 1");
    joint->SetAttribute("limited", "true");
    std::string range = fmt::format("{:.6f} {:.6f}", -chain.joint_range, chain.joint_range);
    joint->SetAttribute("range", range.c_str());
    joint->SetAttribute("damping", num(chain.damping).c_str());
    joint->SetAttribute("stiffness", num(chain.stiffness).c_str());

    for (const auto& site : body.sites) {
        XMLElement* marker = add(doc, link, "site");
        marker->SetAttribute("name", site.name.c_str());
        marker->SetAttribute("pos", vec(site.pos).c_str());
        marker->SetAttribute("size", "0.01");
    }
}

void build_document(XMLDocument& doc, const ChainDescription& chain) {
    doc.InsertEndChild(doc.NewDeclaration());

    XMLElement* root = doc.NewElement("mujoco");
    root->SetAttribute("model", chain.model_name.c_str());
    doc.InsertEndChild(root);

    add_header(doc, root, chain);

    // Each link nests inside the previous one
    XMLElement* parent = add_world(doc, root, chain);
    for (std::size_t i = 0; i < chain.bodies.size(); ++i) {
        add_link(doc, parent, chain.bodies[i], i, chain);
        parent = parent->LastChildElement("body");
    }

    XMLElement* actuator = add(doc, root, "actuator");
    for (const auto& act : chain.actuators) {
        XMLElement* position = add(doc, actuator, "position");
        position->SetAttribute("name", act.name.c_str());
        position->SetAttribute("site", act.site.c_str());
        position->SetAttribute("kp", fmt::format("{:g}", act.kp).c_str());
        position->SetAttribute("kv", fmt::format("{:g}", act.kv).c_str());
    }
}

}  // namespace

std::string to_mjcf(const ChainDescription& chain) {
    XMLDocument doc;
    build_document(doc, chain);

    tinyxml2::XMLPrinter printer;
    doc.Print(&printer);
    return std::string(printer.CStr());
}

void write_mjcf(const ChainDescription& chain, const std::string& path) {
    XMLDocument doc;
    build_document(doc, chain);

    tinyxml2::XMLError err = doc.SaveFile(path.c_str());
    if (err != tinyxml2::XML_SUCCESS) {
        throw std::runtime_error("Failed to write " + path + ": " + doc.ErrorStr());
    }
}

}  // namespace spirob
