#pragma once

#include <QDialog>

#include "form-builder.hh"

// A modal dialog holding a FormBuilderLayout, with OK and Cancel buttons
class FormDialog final : public QDialog
{
   Q_OBJECT

 private:
   FormBuilderLayout* form_{nullptr};

 public:
   using FieldSpec = fauna::FieldSpec;

   FormDialog(const std::string_view title,
              const std::vector<FieldSpec>& fields,
              QWidget* parent = nullptr);
   FormDialog(const FormDialog&) = delete;
   FormDialog(FormDialog&&)      = delete;
   virtual ~FormDialog() = default;

   FormDialog& operator=(const FormDialog&) = delete;
   FormDialog& operator=(FormDialog&&) = delete;

   FormBuilderLayout* form() noexcept { return form_; }
   Json::Value form_data() const noexcept { return form_->get_form_data(); }

   // Runs the dialog. Returns the form data, or Json null on cancel.
   // `initial` (when an object) overrides the field defaults.
   static Json::Value get_form_data(QWidget* parent,
                                    const std::string_view title,
                                    const std::vector<FieldSpec>& fields,
                                    const Json::Value& initial
                                    = Json::Value{}) noexcept(false);
};
