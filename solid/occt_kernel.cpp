#include "occt_kernel.hpp"
#include <common/logging.hpp>

#include <BRepAlgoAPI_Cut.hxx>
#include <BRepAlgoAPI_Fuse.hxx>
#include <BRepBndLib.hxx>
#include <BRepBuilderAPI_MakeFace.hxx>
#include <BRepBuilderAPI_MakePolygon.hxx>
#include <BRepBuilderAPI_Transform.hxx>
#include <BRepMesh_IncrementalMesh.hxx>
#include <BRepPrimAPI_MakePrism.hxx>
#include <BRepPrimAPI_MakeRevol.hxx>
#include <BRep_Builder.hxx>
#include <Bnd_Box.hxx>
#include <IFSelect_ReturnStatus.hxx>
#include <STEPControl_Writer.hxx>
#include <Standard_Failure.hxx>
#include <StlAPI_Writer.hxx>
#include <TopoDS_Compound.hxx>
#include <TopoDS_Face.hxx>
#include <gp_Ax1.hxx>
#include <gp_Ax2.hxx>
#include <gp_Dir.hxx>
#include <gp_Pnt.hxx>
#include <gp_Trsf.hxx>
#include <gp_Vec.hxx>

#include <cmath>
#include <numbers>

namespace spirob {

namespace {

gp_Pnt to_pnt(const Vec3& v) {
    return gp_Pnt(v.x, v.y, v.z);
}

gp_Dir to_dir(const Vec3& v, const char* what) {
    if (v.length_squared() < 1e-24) {
        throw SolidKernelError(std::string("zero-length direction for ") + what);
    }
    return gp_Dir(v.x, v.y, v.z);
}

const TopoDS_Shape& shape_of(const Solid& solid) {
    auto occt = std::dynamic_pointer_cast<const OcctShape>(solid);
    if (!occt) {
        throw SolidKernelError("solid was not created by the OpenCASCADE kernel");
    }
    return occt->shape();
}

Solid wrap(const TopoDS_Shape& shape) {
    return std::make_shared<OcctShape>(shape);
}

TopoDS_Face make_face(const Profile& profile) {
    if (profile.size() < 3) {
        throw SolidKernelError("profile needs at least three vertices");
    }
    BRepBuilderAPI_MakePolygon polygon;
    for (const auto& v : profile) {
        polygon.Add(to_pnt(v));
    }
    polygon.Close();
    if (!polygon.IsDone()) {
        throw SolidKernelError("could not build profile wire");
    }
    BRepBuilderAPI_MakeFace face(polygon.Wire(), Standard_True);
    if (!face.IsDone()) {
        throw SolidKernelError("profile wire is not planar");
    }
    return face.Face();
}

TopoDS_Shape transformed(const TopoDS_Shape& shape, const gp_Trsf& trsf) {
    BRepBuilderAPI_Transform transform(shape, trsf, Standard_True);
    if (!transform.IsDone()) {
        throw SolidKernelError("transform failed");
    }
    return transform.Shape();
}

double to_radians(double deg) {
    return deg * std::numbers::pi / 180.0;
}

}  // namespace

Solid OcctSolidKernel::extrude(const Profile& profile, const Vec3& direction,
                               double distance, bool symmetric) {
    try {
        Vec3 unit = direction.normalized();
        TopoDS_Shape face = make_face(profile);
        double span = distance;
        if (symmetric) {
            gp_Trsf back;
            back.SetTranslation(gp_Vec(-unit.x * distance, -unit.y * distance, -unit.z * distance));
            face = transformed(face, back);
            span = 2.0 * distance;
        }
        BRepPrimAPI_MakePrism prism(face, gp_Vec(unit.x * span, unit.y * span, unit.z * span));
        if (!prism.IsDone()) {
            throw SolidKernelError("extrude failed");
        }
        return wrap(prism.Shape());
    } catch (const Standard_Failure& e) {
        throw SolidKernelError(std::string("extrude: ") + e.GetMessageString());
    }
}

Solid OcctSolidKernel::revolve(const Profile& profile, const Vec3& axis_origin,
                               const Vec3& axis_dir, double angle_deg) {
    try {
        TopoDS_Face face = make_face(profile);
        gp_Ax1 axis(to_pnt(axis_origin), to_dir(axis_dir, "revolve axis"));
        BRepPrimAPI_MakeRevol revol(face, axis, to_radians(angle_deg));
        if (!revol.IsDone()) {
            throw SolidKernelError("revolve failed");
        }
        return wrap(revol.Shape());
    } catch (const Standard_Failure& e) {
        throw SolidKernelError(std::string("revolve: ") + e.GetMessageString());
    }
}

Solid OcctSolidKernel::unite(const Solid& a, const Solid& b) {
    try {
        BRepAlgoAPI_Fuse fuse(shape_of(a), shape_of(b));
        if (!fuse.IsDone()) {
            throw SolidKernelError("union failed");
        }
        return wrap(fuse.Shape());
    } catch (const Standard_Failure& e) {
        throw SolidKernelError(std::string("union: ") + e.GetMessageString());
    }
}

Solid OcctSolidKernel::cut(const Solid& a, const Solid& b) {
    try {
        BRepAlgoAPI_Cut cut_op(shape_of(a), shape_of(b));
        if (!cut_op.IsDone()) {
            throw SolidKernelError("cut failed");
        }
        return wrap(cut_op.Shape());
    } catch (const Standard_Failure& e) {
        throw SolidKernelError(std::string("cut: ") + e.GetMessageString());
    }
}

Solid OcctSolidKernel::translate(const Solid& solid, const Vec3& offset) {
    gp_Trsf trsf;
    trsf.SetTranslation(gp_Vec(offset.x, offset.y, offset.z));
    return wrap(transformed(shape_of(solid), trsf));
}

Solid OcctSolidKernel::rotate(const Solid& solid, const Vec3& origin,
                              const Vec3& axis_dir, double angle_deg) {
    gp_Trsf trsf;
    trsf.SetRotation(gp_Ax1(to_pnt(origin), to_dir(axis_dir, "rotation axis")),
                     to_radians(angle_deg));
    return wrap(transformed(shape_of(solid), trsf));
}

Solid OcctSolidKernel::mirror(const Solid& solid, const Vec3& origin, const Vec3& normal) {
    gp_Trsf trsf;
    trsf.SetMirror(gp_Ax2(to_pnt(origin), to_dir(normal, "mirror plane")));
    return wrap(transformed(shape_of(solid), trsf));
}

BoundingBox OcctSolidKernel::bounding_box(const Solid& solid) {
    Bnd_Box box;
    BRepBndLib::Add(shape_of(solid), box);
    if (box.IsVoid()) {
        throw SolidKernelError("bounding box of an empty shape");
    }
    BoundingBox result;
    box.Get(result.min.x, result.min.y, result.min.z,
            result.max.x, result.max.y, result.max.z);
    return result;
}

void OcctSolidKernel::export_step(const std::vector<Solid>& parts, const std::string& path) {
    auto log = spirob::logging::get_logger();

    BRep_Builder builder;
    TopoDS_Compound compound;
    builder.MakeCompound(compound);
    for (const auto& part : parts) {
        if (part) {
            builder.Add(compound, shape_of(part));
        }
    }

    STEPControl_Writer writer;
    if (writer.Transfer(compound, STEPControl_AsIs) != IFSelect_RetDone) {
        throw SolidKernelError("STEP transfer failed for " + path);
    }
    if (writer.Write(path.c_str()) != IFSelect_RetDone) {
        throw SolidKernelError("Cannot write STEP file: " + path);
    }
    log->debug("OcctSolidKernel: wrote {} part(s) to {}", parts.size(), path);
}

void OcctSolidKernel::export_stl(const Solid& solid, const std::string& path) {
    const TopoDS_Shape& shape = shape_of(solid);
    BRepMesh_IncrementalMesh mesh(shape, linear_deflection, Standard_False,
                                  angular_deflection, Standard_True);
    if (!mesh.IsDone()) {
        throw SolidKernelError("tessellation failed for " + path);
    }
    StlAPI_Writer writer;
    writer.ASCIIMode() = Standard_False;
    if (!writer.Write(shape, path.c_str())) {
        throw SolidKernelError("Cannot write STL file: " + path);
    }
}

}  // namespace spirob
