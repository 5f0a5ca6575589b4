#define CATCH_CONFIG_PREFIX_ALL

#include <catch2/catch.hpp>

#include "stdinc.hpp"

#include "gui/qt-helpers.hpp"
#include "gui/widgets/form-builder.hh"

#include "fauna/io/json-io.hpp"

#include <QCheckBox>
#include <QComboBox>
#include <QDoubleSpinBox>
#include <QLineEdit>
#include <QPushButton>
#include <QSpinBox>
#include <QWidget>

namespace fauna
{
static const char* k_test_form = R"V0G0N(
[
   {"name": "sigma",   "label": "Sigma",    "type": "double", "default": 2.5},
   {"name": "n",       "label": "Frames",   "type": "int",    "default": 8},
   {"name": "big",     "label": "Big",      "type": "int",    "default": 500},
   {"name": "neg",     "label": "Negative", "type": "int",    "default": -5},
   {"name": "far",     "label": "Far",      "type": "double", "default": 150.5},
   {"name": "shuffle", "label": "Shuffle",  "type": "bool",   "default": true},
   {"name": "mode",    "label": "Mode",     "type": "list",
    "options": ["alpha", "beta", "gamma"],  "default": "beta"},
   {"name": "fmt",     "label": "Format",   "type": "list",
    "options": "png,jpg",                   "default": "jpg"},
   {"name": "video",   "label": "Video",    "type": "file_open",
    "filter": "Videos (*.mp4 *.avi)",       "default": "/data/a.mp4"},
   {"name": "outdir",  "label": "Output",   "type": "file_dir", "default": ""},
   {"name": "title",   "label": "Title",    "type": "string", "default": "x"}
]
)V0G0N";

template<typename T>
static T* widget_as(FormBuilderLayout& form, string_view name)
{
   return qobject_cast<T*>(form.field_widget(name));
}

// ------------------------------------------------------------- parse-form-spec

CATCH_TEST_CASE("parse_form_spec", "[form-builder]")
{
   const auto fields = parse_form_spec(string_view(k_test_form));
   CATCH_REQUIRE(fields.size() == 11);
   CATCH_REQUIRE(fields[0].name == "sigma");
   CATCH_REQUIRE(fields[0].default_value.asDouble() == Approx(2.5));
   CATCH_REQUIRE(fields[6].options == "alpha,beta,gamma");
   CATCH_REQUIRE(fields[7].options == "png,jpg");
   CATCH_REQUIRE(fields[8].filter == "Videos (*.mp4 *.avi)");
   CATCH_REQUIRE(fields[9].filter == "Any File (*.*)");
   CATCH_REQUIRE(fields[8].is_file_type());
   CATCH_REQUIRE(fields[9].is_file_type());
   CATCH_REQUIRE(!fields[10].is_file_type());

   CATCH_REQUIRE(is_valid_field_type("file_dir"));
   CATCH_REQUIRE(!is_valid_field_type("colour"));

   CATCH_REQUIRE_THROWS(parse_form_spec(string_view("{}")));
   CATCH_REQUIRE_THROWS(parse_form_spec(string_view(
       R"V0G0N([{"name": "a", "label": "A", "type": "colour"}])V0G0N")));
   CATCH_REQUIRE_THROWS(parse_form_spec(
       string_view(R"V0G0N([{"label": "A", "type": "int"}])V0G0N")));
}

// ----------------------------------------------------------- FormBuilderLayout

CATCH_TEST_CASE("FormBuilderLayout", "[form-builder]")
{
   QWidget host;
   auto form = new FormBuilderLayout(parse_form_spec(string_view(k_test_form)),
                                     &host);

   int n_changes = 0;
   QObject::connect(
       form, &FormBuilderLayout::valueChanged, [&n_changes]() { ++n_changes; });

   CATCH_SECTION("defaults")
   {
      const auto o = form->get_form_data();
      CATCH_REQUIRE(o.size() == 11);
      CATCH_REQUIRE(o["sigma"].asDouble() == Approx(2.5));
      CATCH_REQUIRE(o["n"].asInt() == 8);
      CATCH_REQUIRE(o["big"].asInt() == 500);
      CATCH_REQUIRE(o["neg"].asInt() == -5);
      CATCH_REQUIRE(o["far"].asDouble() == Approx(150.5));
      CATCH_REQUIRE(o["shuffle"].asBool() == true);
      CATCH_REQUIRE(o["mode"].asString() == "beta");
      CATCH_REQUIRE(o["fmt"].asString() == "jpg");
      CATCH_REQUIRE(o["video"].asString() == "/data/a.mp4");
      CATCH_REQUIRE(o["outdir"].asString() == "");
      CATCH_REQUIRE(o["title"].asString() == "x");
      CATCH_REQUIRE(n_changes == 0);
   }

   CATCH_SECTION("ranges-widen-to-fit-defaults")
   {
      const auto big = widget_as<QSpinBox>(*form, "big");
      CATCH_REQUIRE(big != nullptr);
      CATCH_REQUIRE(big->minimum() == 0);
      CATCH_REQUIRE(big->maximum() == 5000);

      const auto neg = widget_as<QSpinBox>(*form, "neg");
      CATCH_REQUIRE(neg->minimum() == -50);

      const auto far = widget_as<QDoubleSpinBox>(*form, "far");
      CATCH_REQUIRE(far->maximum() == Approx(1505.0));

      // Small defaults keep Qt's range
      CATCH_REQUIRE(widget_as<QSpinBox>(*form, "n")->maximum() == 99);
   }

   CATCH_SECTION("file-fields")
   {
      const auto video = widget_as<QLineEdit>(*form, "video");
      CATCH_REQUIRE(video != nullptr);
      CATCH_REQUIRE(!video->isEnabled());
      CATCH_REQUIRE(!widget_as<QLineEdit>(*form, "outdir")->isEnabled());
      CATCH_REQUIRE(widget_as<QLineEdit>(*form, "title")->isEnabled());

      vector<string> buttons;
      for(auto i = 0; i < form->count(); ++i)
         if(auto b = qobject_cast<QPushButton*>(form->itemAt(i)->widget()))
            buttons.push_back(from_qstr(b->text()));
      CATCH_REQUIRE(buttons == vector<string>{"Select Video", "Select Output"});
   }

   CATCH_SECTION("set-form-data")
   {
      form->set_form_data(parse_json(R"V0G0N(
{
   "sigma":   0.75,
   "n":       3,
   "shuffle": false,
   "mode":    "gamma",
   "video":   "/data/b.avi",
   "unknown": 12
}
)V0G0N"));

      // No signals when set programmatically
      CATCH_REQUIRE(n_changes == 0);

      const auto o = form->get_form_data();
      CATCH_REQUIRE(o["sigma"].asDouble() == Approx(0.75));
      CATCH_REQUIRE(o["n"].asInt() == 3);
      CATCH_REQUIRE(o["shuffle"].asBool() == false);
      CATCH_REQUIRE(o["mode"].asString() == "gamma");
      CATCH_REQUIRE(o["video"].asString() == "/data/b.avi");
      CATCH_REQUIRE(!o.isMember("unknown"));

      CATCH_REQUIRE_THROWS(
          form->set_form_data(parse_json(R"V0G0N({"mode": "delta"})V0G0N")));
      CATCH_REQUIRE_THROWS(
          form->set_form_data(parse_json(R"V0G0N({"n": "three"})V0G0N")));
      CATCH_REQUIRE_THROWS(form->set_form_data(parse_json("[1, 2]")));
   }

   CATCH_SECTION("edits-emit-value-changed")
   {
      widget_as<QSpinBox>(*form, "n")->setValue(11);
      CATCH_REQUIRE(n_changes == 1);
      widget_as<QCheckBox>(*form, "shuffle")->setChecked(false);
      CATCH_REQUIRE(n_changes == 2);
      widget_as<QComboBox>(*form, "mode")->setCurrentIndex(0);
      CATCH_REQUIRE(n_changes == 3);
      widget_as<QLineEdit>(*form, "title")->setText("y");
      CATCH_REQUIRE(n_changes == 4);

      const auto o = form->get_form_data();
      CATCH_REQUIRE(o["n"].asInt() == 11);
      CATCH_REQUIRE(o["mode"].asString() == "alpha");
      CATCH_REQUIRE(o["title"].asString() == "y");
   }

   CATCH_SECTION("get-widget-value")
   {
      CATCH_REQUIRE(FormBuilderLayout::get_widget_value(
                        form->field_widget("shuffle"))
                    == Json::Value{true});
      CATCH_REQUIRE(FormBuilderLayout::get_widget_value(&host).isNull());
      CATCH_REQUIRE(form->field_widget("nothing") == nullptr);
   }
}

CATCH_TEST_CASE("FormBuilderLayout numeric defaults", "[form-builder]")
{
   QWidget host;
   auto form = new FormBuilderLayout(parse_form_spec(string_view(R"V0G0N(
[
   {"name": "rate",  "label": "Rate",  "type": "double", "default": 0.0001},
   {"name": "step",  "label": "Step",  "type": "double", "default": 0.125},
   {"name": "huge",  "label": "Huge",  "type": "int",    "default": 300000000},
   {"name": "tiny",  "label": "Tiny",  "type": "int",    "default": -300000000}
]
)V0G0N")),
                                     &host);

   CATCH_SECTION("small-doubles-keep-their-value")
   {
      const auto o = form->get_form_data();
      CATCH_REQUIRE(o["rate"].asDouble() == Approx(0.0001).margin(1e-12));
      CATCH_REQUIRE(o["step"].asDouble() == Approx(0.125).margin(1e-12));
      CATCH_REQUIRE(widget_as<QDoubleSpinBox>(*form, "rate")->decimals() == 4);
      CATCH_REQUIRE(widget_as<QDoubleSpinBox>(*form, "step")->decimals() == 3);
   }

   CATCH_SECTION("ranges-saturate-at-int-limits")
   {
      const auto o = form->get_form_data();
      CATCH_REQUIRE(o["huge"].asInt() == 300000000);
      CATCH_REQUIRE(o["tiny"].asInt() == -300000000);
      CATCH_REQUIRE(widget_as<QSpinBox>(*form, "huge")->maximum()
                    == std::numeric_limits<int>::max());
      CATCH_REQUIRE(widget_as<QSpinBox>(*form, "tiny")->minimum()
                    == std::numeric_limits<int>::lowest());
   }
}

CATCH_TEST_CASE("FormBuilderLayout unknown type", "[form-builder]")
{
   FieldSpec f;
   f.name  = "c";
   f.label = "Colour";
   f.type  = "colour";
   CATCH_REQUIRE_THROWS_AS(FormBuilderLayout({f}), std::runtime_error);
}

} // namespace fauna
