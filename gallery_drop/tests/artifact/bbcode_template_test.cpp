#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "artifact/bbcode_template.hpp"
#include "artifact_test_fixation.hpp"

namespace gallerydrop {
TEST(BBCodeTemplateTest, ReplacesPlaceholders) {
  const TemplateContext context = {{"folderName", "Trip"}, {"pictureCount", "12"}};
  EXPECT_EQ(RenderTemplate("#folderName# (#pictureCount#) #unknown#", context),
            "Trip (12) #unknown#");
}

TEST(BBCodeTemplateTest, ConditionalBlocks) {
  const TemplateContext context = {{"cover", "[img]c[/img]"}, {"hostLinks", "  "}};
  EXPECT_EQ(RenderTemplate("A[if cover]<#cover#>[/if]B", context), "A<[img]c[/img]>B");
  EXPECT_EQ(RenderTemplate("A[if hostLinks]links[/if]B", context), "AB");
  EXPECT_EQ(RenderTemplate("[if missing]yes[else]no[/if]", context), "no");
  EXPECT_EQ(RenderTemplate("[if cover]yes[else]no[/if]", context), "yes");
}

TEST(BBCodeTemplateTest, NestedAndUnbalancedBlocks) {
  const TemplateContext context = {{"a", "1"}, {"b", ""}};
  EXPECT_EQ(RenderTemplate("[if a]x[if b]y[else]z[/if]w[/if]", context), "xzw");
  EXPECT_EQ(RenderTemplate("[if b]x[if a]y[/if][else]e[/if]", context), "e");
  EXPECT_EQ(RenderTemplate("keep [if a]open", context), "keep [if a]open");
}

TEST(BBCodeTemplateTest, DominantExtension) {
  std::vector<UploadedImage> images = {ArtifactTests::MakeImage("a", "png"),
                                       ArtifactTests::MakeImage("b", "PNG"),
                                       ArtifactTests::MakeImage("c", "jpg")};
  EXPECT_EQ(DominantExtension(images), "PNG");
  EXPECT_EQ(DominantExtension({}), "JPG");
  EXPECT_EQ(DominantExtension({ArtifactTests::MakeImage("x", "tiff")}), "JPG");
}

TEST(BBCodeTemplateTest, FailedSummaryIsCapped) {
  EXPECT_EQ(FailedSummary({}), "");

  std::vector<FailedImage> failed;
  for (int i = 0; i < 23; ++i) {
    failed.push_back({"f" + std::to_string(i) + ".jpg", "timeout"});
  }
  const auto summary = FailedSummary(failed);
  EXPECT_EQ(summary.rfind("[b]Failed (23):[/b]\n- f0.jpg: timeout", 0), 0u);
  EXPECT_NE(summary.find("- f19.jpg: timeout"), std::string::npos);
  EXPECT_EQ(summary.find("- f20.jpg"), std::string::npos);
  EXPECT_NE(summary.find("\n... and 3 more"), std::string::npos);
}

TEST_F(ArtifactTests, ContextFromResult) {
  TemplateExtras extras;
  extras.cover_                   = "[img]cover[/img]";
  extras.custom_fields_["custom2"] = "note";
  const auto context              = BuildTemplateContext(MakeResult(), extras);

  EXPECT_EQ(context.at("folderName"), "Trip");
  EXPECT_EQ(context.at("pictureCount"), "3");
  EXPECT_EQ(context.at("width"), "1920");
  EXPECT_EQ(context.at("height"), "1080");
  EXPECT_EQ(context.at("longest"), "1920");
  EXPECT_EQ(context.at("extension"), "JPG");
  EXPECT_EQ(context.at("folderSize"), "1.5 MiB");
  EXPECT_EQ(context.at("galleryLink"), "https://host/g/g42");
  EXPECT_EQ(context.at("allImages"), "[img]a[/img]  [img]b[/img]  [img]c[/img]");
  EXPECT_EQ(context.at("cover"), "[img]cover[/img]");
  EXPECT_EQ(context.at("custom2"), "note");
  EXPECT_EQ(context.at("custom1"), "");
  EXPECT_EQ(context.at("ext4"), "");
}

TEST_F(ArtifactTests, DefaultTemplateRendersWithoutLeftovers) {
  const auto text = RenderTemplate(kDefaultTemplate, BuildTemplateContext(MakeResult()));
  EXPECT_NE(text.find("[b]Trip[/b]"), std::string::npos);
  EXPECT_NE(text.find("Resolution: 1920x1080"), std::string::npos);
  EXPECT_NE(text.find("[url=https://host/g/g42]"), std::string::npos);
  EXPECT_EQ(text.find("Download:"), std::string::npos);
  EXPECT_EQ(text.find('#'), std::string::npos);
  EXPECT_EQ(text.find("[if"), std::string::npos);
}
};  // namespace gallerydrop
