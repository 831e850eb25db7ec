#include "math/Math.hpp"
#include "math/Mesh3D.hpp"
#include "math/PainterSorter.hpp"
#include "utils/FrameDriver.hpp"
#include "utils/HouseMesh.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <vector>

#include <glm/gtc/constants.hpp>
#include <glm/gtc/type_ptr.hpp>

static int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n";                    \
    }                                                                                                                \
  } while (0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if (!(_a == _b)) {                                                                                               \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b << "\n";   \
    }                                                                                                                \
  } while (0)

#define EXPECT_NEAR(a, b, eps)                                                                                        \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    const auto _e = (eps);                                                                                           \
    if (std::fabs((_a) - (_b)) > (_e)) {                                                                             \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NEAR failed: " << #a << " ~= " << #b << " (eps=" << _e   \
                << ")\n";                                                                                            \
    }                                                                                                                \
  } while (0)

#define ASSERT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond << "\n";                    \
      return;                                                                                                        \
    }                                                                                                                \
  } while (0)

static bool MatNear(const glm::mat4& a, const glm::mat4& b, float eps)
{
  const float* pa = glm::value_ptr(a);
  const float* pb = glm::value_ptr(b);
  for (int i = 0; i < 16; ++i) {
    if (std::fabs(pa[i] - pb[i]) > eps) return false;
  }
  return true;
}

static bool VecNear(const glm::vec3& a, const glm::vec3& b, float eps)
{
  return std::fabs(a.x - b.x) <= eps && std::fabs(a.y - b.y) <= eps && std::fabs(a.z - b.z) <= eps;
}

static std::vector<std::uint32_t> Ids(const Mesh3D& mesh)
{
  std::vector<std::uint32_t> ids;
  for (const Triangle& t : mesh.getTriangles()) ids.push_back(t.id);
  return ids;
}

static glm::mat4 ViewAtZeroRotation()
{
  return Math::multiply(Math::translate(0.0f, -0.2f, -3.0f), Math::rotateY(0.0f));
}

// Records what the frame driver hands to the GPU side.
class RecordingRasterizer : public IRasterizer {
public:
  void drawTriangles(const std::vector<Vertex>& vertices, const glm::mat4& modelView, const glm::mat4& projection) override
  {
    ++calls;
    stream = vertices;
    lastModelView = modelView;
    lastProjection = projection;
  }

  int calls = 0;
  std::vector<Vertex> stream;
  glm::mat4 lastModelView = glm::mat4(1.0f);
  glm::mat4 lastProjection = glm::mat4(1.0f);
};

static void TestIdentityAndMultiply()
{
  const glm::mat4 I = Math::identity();
  const glm::mat4 T = Math::translate(1.0f, 2.0f, 3.0f);
  const glm::mat4 R = Math::rotateY(0.7f);

  EXPECT_TRUE(MatNear(Math::multiply(I, T), T, 0.0f));
  EXPECT_TRUE(MatNear(Math::multiply(T, I), T, 0.0f));
  EXPECT_TRUE(MatNear(Math::rotateY(0.0f), I, 0.0f));

  // multiply(T, R) rotates first
  const glm::vec3 p(1.0f, 0.0f, 0.0f);
  const glm::vec3 viaProduct = Math::transformPoint(Math::multiply(T, R), p);
  const glm::vec3 stepwise = Math::transformPoint(T, Math::transformPoint(R, p));
  EXPECT_TRUE(VecNear(viaProduct, stepwise, 1e-5f));
}

static void TestTranslate()
{
  const glm::mat4 T = Math::translate(1.5f, -2.0f, 4.0f);
  // column-major: translation lives in column 3
  EXPECT_EQ(T[3][0], 1.5f);
  EXPECT_EQ(T[3][1], -2.0f);
  EXPECT_EQ(T[3][2], 4.0f);
  EXPECT_EQ(glm::value_ptr(T)[12], 1.5f);

  const glm::vec3 moved = Math::transformPoint(T, glm::vec3(1.0f, 1.0f, 1.0f));
  EXPECT_TRUE(VecNear(moved, glm::vec3(2.5f, -1.0f, 5.0f), 0.0f));
}

static void TestRotateY()
{
  const float half = glm::half_pi<float>();
  const glm::vec3 x = Math::transformPoint(Math::rotateY(half), glm::vec3(1.0f, 0.0f, 0.0f));
  EXPECT_TRUE(VecNear(x, glm::vec3(0.0f, 0.0f, -1.0f), 1e-6f));

  const glm::vec3 z = Math::transformPoint(Math::rotateY(half), glm::vec3(0.0f, 0.0f, 1.0f));
  EXPECT_TRUE(VecNear(z, glm::vec3(1.0f, 0.0f, 0.0f), 1e-6f));

  // y is untouched and lengths are preserved
  const glm::vec3 p(0.3f, 0.8f, -0.4f);
  const glm::vec3 r = Math::transformPoint(Math::rotateY(1.234f), p);
  EXPECT_NEAR(r.y, p.y, 1e-6f);
  EXPECT_NEAR(glm::length(r), glm::length(p), 1e-5f);

  // composing a rotation with its inverse is the identity
  EXPECT_TRUE(MatNear(Math::multiply(Math::rotateY(0.9f), Math::rotateY(-0.9f)), Math::identity(), 1e-6f));
}

static void TestPerspective()
{
  const float fov = glm::quarter_pi<float>();
  const float n = 0.1f;
  const float f = 100.0f;
  const glm::mat4 P = Math::perspective(fov, 2.0f, n, f);

  const float focal = 1.0f / std::tan(fov * 0.5f);
  EXPECT_NEAR(P[0][0], focal / 2.0f, 1e-5f);
  EXPECT_NEAR(P[1][1], focal, 1e-5f);
  EXPECT_NEAR(P[2][2], -(f + n) / (f - n), 1e-5f);
  EXPECT_EQ(P[2][3], -1.0f);
  EXPECT_NEAR(P[3][2], -(2.0f * f * n) / (f - n), 1e-5f);
  EXPECT_EQ(P[3][3], 0.0f);

  // near plane maps to clip z = -w, far plane to +w
  const glm::vec4 nearClip = P * glm::vec4(0.0f, 0.0f, -n, 1.0f);
  const glm::vec4 farClip = P * glm::vec4(0.0f, 0.0f, -f, 1.0f);
  EXPECT_NEAR(nearClip.z / nearClip.w, -1.0f, 1e-4f);
  EXPECT_NEAR(farClip.z / farClip.w, 1.0f, 1e-4f);
}

static void TestTransformPointDropsW()
{
  const glm::mat4 P = Math::perspective(glm::quarter_pi<float>(), 1.0f, 0.1f, 100.0f);
  const glm::vec3 p(0.5f, 0.5f, -2.0f);
  const glm::vec3 out = Math::transformPoint(P, p);
  const glm::vec4 full = P * glm::vec4(p, 1.0f);
  // no perspective divide
  EXPECT_TRUE(VecNear(out, glm::vec3(full), 0.0f));
}

static void TestHouseBuild()
{
  const Mesh3D a = HouseMesh::build();
  EXPECT_EQ(a.size(), HouseMesh::TRIANGLE_COUNT);
  EXPECT_EQ(a.size(), static_cast<std::size_t>(16));

  const std::vector<Triangle>& tris = a.getTriangles();
  for (std::size_t i = 0; i < tris.size(); ++i) {
    EXPECT_EQ(tris[i].id, static_cast<std::uint32_t>(i));
    for (int k = 0; k < 3; ++k) {
      const glm::vec3& v = tris[i].v[k];
      EXPECT_TRUE(v.x >= -0.5f && v.x <= 0.5f);
      EXPECT_TRUE(v.y >= 0.0f && v.y <= 1.0f);
      EXPECT_TRUE(v.z >= -0.5f && v.z <= 0.5f);
    }
  }

  EXPECT_TRUE(tris[0].color == HouseMesh::FRONT_COLOR);
  EXPECT_TRUE(tris[1].color == HouseMesh::FRONT_COLOR);
  EXPECT_TRUE(tris[4].color == HouseMesh::BACK_COLOR);
  EXPECT_TRUE(tris[8].color == HouseMesh::BOTTOM_COLOR);
  for (std::size_t i = 12; i < 16; ++i) {
    EXPECT_TRUE(tris[i].color == HouseMesh::ROOF_COLOR);
    EXPECT_TRUE(tris[i].v[2] == glm::vec3(0.0f, 1.0f, 0.0f));
  }

  // every build is an independent copy
  Mesh3D b = HouseMesh::build();
  b.getTriangles()[0].depth = 42.0f;
  PainterSorter::computeDepths(b, ViewAtZeroRotation());
  PainterSorter::sortBackToFront(b);
  const Mesh3D c = HouseMesh::build();
  EXPECT_EQ(c.getTriangles()[0].id, 0u);
  EXPECT_EQ(c.getTriangles()[0].depth, 0.0f);
}

static void TestDepthKeys()
{
  Mesh3D mesh = HouseMesh::build();
  PainterSorter::computeDepths(mesh, ViewAtZeroRotation());
  const std::vector<Triangle>& t = mesh.getTriangles();

  EXPECT_NEAR(t[0].depth, -2.5f, 1e-5f);  // front wall
  EXPECT_NEAR(t[4].depth, -3.5f, 1e-5f);  // back wall
  EXPECT_NEAR(t[12].depth, -8.0f / 3.0f, 1e-5f);
  EXPECT_NEAR(t[13].depth, -3.0f, 1e-5f);
  EXPECT_NEAR(t[14].depth, -10.0f / 3.0f, 1e-5f);

  // the mesh itself is not reordered by computing keys
  EXPECT_EQ(t[5].id, 5u);
}

static void TestBackToFrontOrderAtRest()
{
  Mesh3D mesh = HouseMesh::build();
  PainterSorter::computeDepths(mesh, ViewAtZeroRotation());
  PainterSorter::sortBackToFront(mesh);

  const std::vector<std::uint32_t> expected = {4, 5, 14, 2, 7, 8, 11, 13, 15, 3, 6, 9, 10, 12, 0, 1};
  EXPECT_TRUE(Ids(mesh) == expected);

  const std::vector<Triangle>& t = mesh.getTriangles();
  for (std::size_t i = 1; i < t.size(); ++i) {
    EXPECT_TRUE(t[i - 1].depth <= t[i].depth);
    EXPECT_FALSE(PainterSorter::drawsBefore(t[i], t[i - 1]));
  }
}

static void TestSortIsIdempotent()
{
  Mesh3D mesh = HouseMesh::build();
  const glm::mat4 mv = Math::multiply(Math::translate(0.0f, -0.2f, -3.0f), Math::rotateY(2.1f));
  PainterSorter::computeDepths(mesh, mv);
  PainterSorter::sortBackToFront(mesh);
  const std::vector<std::uint32_t> once = Ids(mesh);

  PainterSorter::computeDepths(mesh, mv);
  PainterSorter::sortBackToFront(mesh);
  EXPECT_TRUE(Ids(mesh) == once);
}

static void TestSortSmallMeshes()
{
  Mesh3D empty;
  PainterSorter::sortBackToFront(empty);
  EXPECT_TRUE(empty.empty());

  Mesh3D single;
  single.addTriangle(glm::vec3(0.0f), glm::vec3(1.0f, 0.0f, 0.0f), glm::vec3(0.0f, 1.0f, 0.0f), glm::vec3(1.0f));
  single.getTriangles()[0].depth = -7.0f;
  PainterSorter::sortBackToFront(single);
  EXPECT_EQ(single.size(), static_cast<std::size_t>(1));
  EXPECT_EQ(single.getTriangles()[0].depth, -7.0f);
}

static void TestTiesKeepIdOrder()
{
  Mesh3D mesh;
  for (int i = 0; i < 5; ++i) {
    mesh.addTriangle(glm::vec3(0.0f, 0.0f, -1.0f), glm::vec3(1.0f, 0.0f, -1.0f), glm::vec3(0.0f, 1.0f, -1.0f),
                     glm::vec3(0.2f * i));
  }
  // scramble before sorting
  std::reverse(mesh.getTriangles().begin(), mesh.getTriangles().end());
  PainterSorter::computeDepths(mesh, Math::identity());
  PainterSorter::sortBackToFront(mesh);

  const std::vector<std::uint32_t> expected = {0, 1, 2, 3, 4};
  EXPECT_TRUE(Ids(mesh) == expected);
}

static void TestRotationIsFunctionOfTime()
{
  FrameDriver driver;
  EXPECT_EQ(driver.rotationFor(0.0), 0.0f);
  EXPECT_NEAR(driver.rotationFor(2.0), 1.0f, 1e-6f);
  EXPECT_NEAR(driver.rotationFor(10.0), 5.0f, 1e-6f);
  EXPECT_NEAR(driver.rotationFor(2.0 * glm::two_pi<double>()), glm::two_pi<float>(), 1e-5f);

  FrameConfig fast;
  fast.angularSpeed = 2.0f;
  driver.setConfig(fast);
  EXPECT_NEAR(driver.rotationFor(1.5), 3.0f, 1e-6f);
}

static void TestTickProducesSortedStream()
{
  FrameDriver driver;
  RecordingRasterizer raster;
  driver.tick(0.0, 800.0f / 600.0f, raster);

  EXPECT_EQ(raster.calls, 1);
  ASSERT_TRUE(raster.stream.size() == 48);
  EXPECT_EQ(driver.getState().vertexCount, static_cast<std::size_t>(48));
  EXPECT_EQ(driver.getState().rotationY, 0.0f);

  // roof back face (14) must come before both front wall triangles (0, 1)
  const std::vector<std::uint32_t> ids = Ids(driver.getMesh());
  const auto pos = [&](std::uint32_t id) { return std::find(ids.begin(), ids.end(), id) - ids.begin(); };
  EXPECT_TRUE(pos(14) < pos(0));
  EXPECT_TRUE(pos(14) < pos(1));

  // the stream is the sorted mesh, three vertices per triangle
  const std::vector<Triangle>& tris = driver.getMesh().getTriangles();
  for (std::size_t i = 0; i < tris.size(); ++i) {
    for (int k = 0; k < 3; ++k) {
      EXPECT_TRUE(raster.stream[i * 3 + k].position == tris[i].v[k]);
      EXPECT_TRUE(raster.stream[i * 3 + k].color == tris[i].color);
    }
  }

  EXPECT_TRUE(MatNear(raster.lastModelView, driver.getState().modelView, 0.0f));
  EXPECT_TRUE(MatNear(raster.lastProjection, driver.getState().projection, 0.0f));
  EXPECT_TRUE(MatNear(raster.lastModelView, ViewAtZeroRotation(), 1e-6f));
}

static void TestHalfTurnSwapsFrontAndBack()
{
  FrameDriver driver;
  RecordingRasterizer raster;
  // 0.5 rad/s for 2*pi seconds is a half turn
  driver.tick(glm::two_pi<double>(), 1.0f, raster);
  EXPECT_NEAR(driver.getState().rotationY, glm::pi<float>(), 1e-5f);

  const std::vector<std::uint32_t> ids = Ids(driver.getMesh());
  ASSERT_TRUE(ids.size() == 16);
  // the front wall now faces away and is painted first; the back wall last
  EXPECT_TRUE((ids[0] == 0 && ids[1] == 1) || (ids[0] == 1 && ids[1] == 0));
  EXPECT_TRUE((ids[14] == 4 && ids[15] == 5) || (ids[14] == 5 && ids[15] == 4));
}

static void TestRepeatedTicksAreStable()
{
  FrameDriver driver;
  RecordingRasterizer raster;
  driver.tick(3.3, 1.5f, raster);
  const std::vector<std::uint32_t> first = Ids(driver.getMesh());
  const std::vector<Vertex> firstStream = raster.stream;

  // same time again from a different starting order
  driver.tick(0.0, 1.5f, raster);
  driver.tick(3.3, 1.5f, raster);
  EXPECT_TRUE(Ids(driver.getMesh()) == first);
  ASSERT_TRUE(raster.stream.size() == firstStream.size());
  for (std::size_t i = 0; i < firstStream.size(); ++i) {
    EXPECT_TRUE(raster.stream[i].position == firstStream[i].position);
  }
  EXPECT_EQ(raster.calls, 3);
}

static void TestFlatten()
{
  Mesh3D mesh;
  mesh.addTriangle(glm::vec3(1.0f, 0.0f, 0.0f), glm::vec3(0.0f, 1.0f, 0.0f), glm::vec3(0.0f, 0.0f, 1.0f),
                   glm::vec3(0.5f, 0.25f, 0.125f));
  const std::vector<Vertex> out = FrameDriver::flatten(mesh);
  ASSERT_TRUE(out.size() == 3);
  EXPECT_TRUE(out[1].position == glm::vec3(0.0f, 1.0f, 0.0f));
  EXPECT_TRUE(out[2].color == glm::vec3(0.5f, 0.25f, 0.125f));

  // the output vector is replaced, not appended to
  std::vector<Vertex> reused(10);
  FrameDriver::flatten(mesh, reused);
  EXPECT_EQ(reused.size(), static_cast<std::size_t>(3));

  EXPECT_TRUE(FrameDriver::flatten(Mesh3D()).empty());
}

int main()
{
  TestIdentityAndMultiply();
  TestTranslate();
  TestRotateY();
  TestPerspective();
  TestTransformPointDropsW();
  TestHouseBuild();
  TestDepthKeys();
  TestBackToFrontOrderAtRest();
  TestSortIsIdempotent();
  TestSortSmallMeshes();
  TestTiesKeepIdOrder();
  TestRotationIsFunctionOfTime();
  TestTickProducesSortedStream();
  TestHalfTurnSwapsFrontAndBack();
  TestRepeatedTicksAreStable();
  TestFlatten();

  if (g_failures == 0) {
    std::cout << "painter_house_tests: OK\n";
    return 0;
  }

  std::cerr << "painter_house_tests: FAILED (" << g_failures << ")\n";
  return 1;
}
